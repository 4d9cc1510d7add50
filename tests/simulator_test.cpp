// Tests for the simulation pipeline and the background worker.
// Author: Philip Salvaggio

#include "base/lcg_random.h"
#include "base/radiometry.h"
#include "base/simulation_worker.h"
#include "base/simulator.h"
#include "base/wait_queue.h"

#include <gtest/gtest.h>
#include <opencv2/core/core.hpp>

#include <chrono>
#include <cmath>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace std;
using namespace cv;
using namespace apsim;

namespace {

SimulationRequest PinholeRequest(const Mat& source) {
  SimulationRequest request;
  request.aperture.set_type(ApertureParameters::PINHOLE);
  request.aperture.set_diameter(0.3);
  request.source = source;
  return request;
}

Mat RandomSource(int rows, int cols) {
  Mat source(rows, cols, CV_8UC4);
  RNG rng(3);
  rng.fill(source, RNG::UNIFORM, 0, 256);
  return source;
}

// Collects the responses of a worker.
class ResponseCollector {
 public:
  void Add(uint64_t id, const SimulationResponse& response) {
    {
      lock_guard<mutex> lock(mutex_);
      responses_[id].push_back(response);
    }
    received_.notify_all();
  }

  bool WaitFor(size_t count) {
    unique_lock<mutex> lock(mutex_);
    return received_.wait_for(lock, chrono::seconds(120), [&] {
      return Count() >= count;
    });
  }

  size_t Count() const {
    size_t count = 0;
    for (const auto& entry : responses_) count += entry.second.size();
    return count;
  }

  map<uint64_t, vector<SimulationResponse>> responses() {
    lock_guard<mutex> lock(mutex_);
    return responses_;
  }

 private:
  mutex mutex_;
  condition_variable received_;
  map<uint64_t, vector<SimulationResponse>> responses_;
};

}

TEST(LcgRandomTest, Sequence) {
  LcgRandom random(0);
  EXPECT_EQ(12345u, random.state());

  double value = random.Next();
  EXPECT_EQ(87628868u, random.state());
  EXPECT_NEAR(87628868 / 4294967296.0, value, 1e-15);

  random.Next();
  EXPECT_EQ(71072467u, random.state());

  LcgRandom other(12345);
  other.Next();
  EXPECT_EQ(87628868u, other.state());
}

TEST(WaitQueueTest, DrainAndClose) {
  WaitQueue<int> queue;
  EXPECT_TRUE(queue.empty());

  queue.push(new int(1));
  queue.push(new int(2));
  queue.push(new int(3));
  EXPECT_EQ(3u, queue.size());

  unique_ptr<int> first = queue.wait();
  ASSERT_TRUE(first != nullptr);
  EXPECT_EQ(1, *first);

  vector<unique_ptr<int>> rest = queue.drain();
  ASSERT_EQ(2u, rest.size());
  EXPECT_EQ(2, *rest[0]);
  EXPECT_EQ(3, *rest[1]);
  EXPECT_TRUE(queue.empty());

  queue.push(new int(4));
  queue.close();
  unique_ptr<int> last = queue.wait();
  ASSERT_TRUE(last != nullptr);
  EXPECT_EQ(4, *last);
  EXPECT_TRUE(queue.wait() == nullptr);
}

TEST(SimulatorTest, UniformGreyStaysUniform) {
  Mat source(48, 64, CV_8UC4, Scalar(128, 128, 128, 255));

  for (auto strategy : {SimulationOptions::FREQUENCY_DOMAIN,
                        SimulationOptions::SPARSE_SPATIAL}) {
    SimulationRequest request = PinholeRequest(source);
    request.options.set_convolution_strategy(strategy);

    SimulationResponse response = Simulator().Run(request);
    ASSERT_TRUE(response.success) << response.error;
    ASSERT_EQ(CV_8UC4, response.image.type());
    ASSERT_EQ(source.size(), response.image.size());

    // 128 linearized, tone mapped and encoded again.
    double linear = pow(128 / 255.0, kDisplayGamma);
    int expected = cvRound(pow(AcesFilmic(linear), 1 / kDisplayGamma) * 255);
    EXPECT_NEAR(154, expected, 1);

    for (int i = 0; i < source.rows; i++) {
      for (int j = 0; j < source.cols; j++) {
        Vec4b pixel = response.image.at<Vec4b>(i, j);
        for (int c = 0; c < 3; c++) EXPECT_NEAR(expected, pixel[c], 1);
        EXPECT_EQ(255, pixel[3]);
      }
    }
  }
}

TEST(SimulatorTest, StrategiesAgree) {
  Mat source = RandomSource(60, 80);

  SimulationRequest request = PinholeRequest(source);
  request.aperture.set_diameter(1);
  request.camera.set_sensor_width(8);

  request.options.set_convolution_strategy(SimulationOptions::FREQUENCY_DOMAIN);
  SimulationResponse frequency = Simulator().Run(request);
  request.options.set_convolution_strategy(SimulationOptions::SPARSE_SPATIAL);
  SimulationResponse sparse = Simulator().Run(request);

  ASSERT_TRUE(frequency.success) << frequency.error;
  ASSERT_TRUE(sparse.success) << sparse.error;
  EXPECT_LE(norm(frequency.image, sparse.image, NORM_INF), 1);
}

TEST(SimulatorTest, ExposureBrightens) {
  Mat source(32, 32, CV_8UC4, Scalar(60, 60, 60, 255));

  SimulationRequest request = PinholeRequest(source);
  SimulationResponse normal = Simulator().Run(request);
  request.exposure = 4;
  SimulationResponse bright = Simulator().Run(request);

  ASSERT_TRUE(normal.success) << normal.error;
  ASSERT_TRUE(bright.success) << bright.error;
  EXPECT_GT(bright.image.at<Vec4b>(16, 16)[0],
            normal.image.at<Vec4b>(16, 16)[0]);
}

TEST(SimulatorTest, PolychromaticProducesImage) {
  SimulationRequest request = PinholeRequest(RandomSource(40, 60));
  request.options.set_polychromatic(true);
  request.options.set_vignetting(true);
  request.options.set_noise_seed(17);
  request.camera.set_iso(1600);

  Simulator simulator;
  SimulationResponse first = simulator.Run(request);
  SimulationResponse second = simulator.Run(request);
  ASSERT_TRUE(first.success) << first.error;
  ASSERT_TRUE(second.success) << second.error;

  // Seeded noise reproduces.
  EXPECT_EQ(0, norm(first.image, second.image, NORM_INF));
}

TEST(SimulatorTest, DownsamplesWideSources) {
  SimulationRequest request = PinholeRequest(RandomSource(100, 200));
  request.options.set_processing_width(100);

  SimulationResponse response = Simulator().Run(request);
  ASSERT_TRUE(response.success) << response.error;
  EXPECT_EQ(100, response.image.cols);
  EXPECT_EQ(50, response.image.rows);
}

TEST(SimulatorTest, SelectWavelengths) {
  CameraParameters camera;
  camera.set_wavelength(600);
  SimulationOptions options;

  EXPECT_EQ(vector<double>{600},
            Simulator::SelectWavelengths(camera, options));

  options.set_polychromatic(true);
  EXPECT_EQ((vector<double>{640, 540, 460}),
            Simulator::SelectWavelengths(camera, options));

  options.add_rgb_wavelength(700);
  options.add_rgb_wavelength(550);
  options.add_rgb_wavelength(450);
  EXPECT_EQ((vector<double>{700, 550, 450}),
            Simulator::SelectWavelengths(camera, options));
}

TEST(SimulatorTest, ReportsFailures) {
  Simulator simulator;

  SimulationResponse response = simulator.Run(PinholeRequest(Mat()));
  EXPECT_FALSE(response.success);
  EXPECT_FALSE(response.error.empty());
  EXPECT_TRUE(response.image.empty());

  SimulationRequest request =
      PinholeRequest(Mat(8, 8, CV_8UC4, Scalar::all(100)));
  request.exposure = -1;
  response = simulator.Run(request);
  EXPECT_FALSE(response.success);

  request.exposure = 1;
  request.aperture.set_diameter(0);
  response = simulator.Run(request);
  EXPECT_FALSE(response.success);
  EXPECT_FALSE(response.error.empty());
}

TEST(SimulatorTest, InvalidWavelengthFails) {
  SimulationRequest request =
      PinholeRequest(Mat(8, 8, CV_8UC4, Scalar::all(100)));
  request.camera.set_wavelength(0);

  Simulator simulator;
  SimulationResponse response = simulator.Run(request);
  EXPECT_FALSE(response.success);
  EXPECT_NE(string::npos, response.error.find("wavelength"));
  EXPECT_TRUE(response.image.empty());

  request.camera.set_wavelength(550);
  request.options.set_polychromatic(true);
  request.options.add_rgb_wavelength(640);
  request.options.add_rgb_wavelength(NAN);
  request.options.add_rgb_wavelength(460);
  response = simulator.Run(request);
  EXPECT_FALSE(response.success);
}

TEST(SimulatorTest, NarrowSlitOnSmallImage) {
  // The diffractive window of this slit is 1.1 m, far wider than the image.
  SimulationRequest request = PinholeRequest(RandomSource(16, 16));
  request.aperture.set_type(ApertureParameters::SLIT);
  request.aperture.set_diameter(2);
  request.aperture.set_slit_width(0.001);

  SimulationResponse response = Simulator().Run(request);
  ASSERT_TRUE(response.success) << response.error;
  EXPECT_EQ(Size(16, 16), response.image.size());
}

TEST(SimulatorTest, CancelledRunIsAbandoned) {
  SimulationRequest request =
      PinholeRequest(Mat(8, 8, CV_8UC4, Scalar::all(100)));

  SimulationResponse response =
      Simulator().Run(request, []() { return true; });
  EXPECT_FALSE(response.success);
  EXPECT_EQ("Simulation was abandoned.", response.error);
  EXPECT_TRUE(response.image.empty());
}

TEST(SimulationWorkerTest, NewestRequestWins) {
  ResponseCollector collector;
  vector<uint64_t> ids;
  {
    SimulationWorker worker([&](uint64_t request_id,
                                const SimulationResponse& response) {
      collector.Add(request_id, response);
    });

    for (int i = 0; i < 4; i++) {
      ids.push_back(worker.Submit(PinholeRequest(RandomSource(60, 90))));
    }
    ASSERT_TRUE(collector.WaitFor(ids.size()));
  }

  auto responses = collector.responses();
  ASSERT_EQ(ids.size(), responses.size());
  for (uint64_t id : ids) {
    ASSERT_EQ(1u, responses[id].size()) << id;
    const SimulationResponse& response = responses[id][0];
    if (id == ids.back()) {
      EXPECT_TRUE(response.success) << response.error;
      EXPECT_FALSE(response.image.empty());
    } else if (!response.success) {
      EXPECT_EQ(SimulationWorker::kSupersededError, response.error);
    }
  }
}

TEST(SimulationWorkerTest, ReportsFailures) {
  ResponseCollector collector;
  uint64_t id;
  {
    SimulationWorker worker([&](uint64_t request_id,
                                const SimulationResponse& response) {
      collector.Add(request_id, response);
    });
    id = worker.Submit(PinholeRequest(Mat()));
    ASSERT_TRUE(collector.WaitFor(1));
  }

  auto responses = collector.responses();
  ASSERT_EQ(1u, responses[id].size());
  EXPECT_FALSE(responses[id][0].success);
  EXPECT_NE(SimulationWorker::kSupersededError, responses[id][0].error);
}

TEST(SimulationWorkerTest, ShutdownAnswersEverything) {
  ResponseCollector collector;
  {
    SimulationWorker worker([&](uint64_t request_id,
                                const SimulationResponse& response) {
      collector.Add(request_id, response);
    });
    for (int i = 0; i < 3; i++) {
      worker.Submit(PinholeRequest(RandomSource(60, 90)));
    }
  }
  EXPECT_EQ(3u, collector.Count());
}
