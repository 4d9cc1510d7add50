// Runs simulation requests on a background thread. Only the newest request
// matters: submitting a request abandons the one that is running and any that
// are still waiting. Every submitted request gets exactly one response, and
// abandoned requests are answered with a failure instead of their results.
// Author: Philip Salvaggio

#ifndef SIMULATION_WORKER_H
#define SIMULATION_WORKER_H

#include "base/simulator.h"
#include "base/wait_queue.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <thread>

namespace apsim {

class SimulationWorker {
 public:
  // Called on the worker thread once per request.
  using Callback = std::function<void(uint64_t request_id,
                                      const SimulationResponse& response)>;

  explicit SimulationWorker(Callback callback);

  // Abandons outstanding requests and joins the worker thread.
  ~SimulationWorker();

  SimulationWorker(const SimulationWorker& other) = delete;
  SimulationWorker& operator=(const SimulationWorker& other) = delete;

  // Queue a request and return its id. Does not block.
  uint64_t Submit(SimulationRequest request);

  static const char* kSupersededError;

 private:
  struct Job {
    uint64_t id;
    SimulationRequest request;
  };

  void Loop();
  bool IsStale(uint64_t id) const { return id != latest_id_.load(); }
  void Reject(const Job& job);

  Callback callback_;
  Simulator simulator_;
  WaitQueue<Job> queue_;
  std::atomic<uint64_t> latest_id_;
  std::thread thread_;
};

}

#endif  // SIMULATION_WORKER_H
