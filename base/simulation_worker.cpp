// File Description
// Author: Philip Salvaggio

#include "simulation_worker.h"

#include "io/logging.h"

#include <iostream>
#include <limits>
#include <utility>

using namespace std;

namespace apsim {

const char* SimulationWorker::kSupersededError =
    "Request was superseded by a newer request.";

SimulationWorker::SimulationWorker(Callback callback)
    : callback_(move(callback)),
      simulator_(),
      queue_(),
      latest_id_(0),
      thread_(&SimulationWorker::Loop, this) {}

SimulationWorker::~SimulationWorker() {
  // No request id can match this, so everything outstanding is stale.
  latest_id_ = numeric_limits<uint64_t>::max();
  queue_.close();
  if (thread_.joinable()) thread_.join();
}

uint64_t SimulationWorker::Submit(SimulationRequest request) {
  uint64_t id = ++latest_id_;
  queue_.push(new Job{id, move(request)});
  return id;
}

void SimulationWorker::Reject(const Job& job) {
  SimulationResponse response;
  response.success = false;
  response.error = kSupersededError;
  callback_(job.id, response);
}

void SimulationWorker::Loop() {
  while (true) {
    unique_ptr<Job> job = queue_.wait();
    if (!job) return;

    // Anything queued behind this job is newer and replaces it.
    for (unique_ptr<Job>& newer : queue_.drain()) {
      Reject(*job);
      job = move(newer);
    }

    if (IsStale(job->id)) {
      Reject(*job);
      continue;
    }

    const uint64_t kId = job->id;
    SimulationResponse response = simulator_.Run(
        job->request, [this, kId]() { return IsStale(kId); });

    if (IsStale(kId)) {
      mainLog() << "Discarding the result of superseded request " << kId
                << "." << endl;
      Reject(*job);
    } else {
      callback_(kId, response);
    }
  }
}

}
