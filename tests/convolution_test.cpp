// Tests for the convolution strategies and the convolution engine.
// Author: Philip Salvaggio

#include "base/simulation_config.pb.h"
#include "convolution/convolution_engine.h"
#include "convolution/frequency_domain_convolver.h"
#include "convolution/sparse_spatial_convolver.h"

#include <gtest/gtest.h>
#include <opencv2/core/core.hpp>

#include <memory>
#include <vector>

using namespace std;
using namespace cv;
using namespace apsim;

namespace {

Mat_<double> GaussianKernel(int size, double sigma) {
  Mat_<double> kernel(size, size);
  const int kHalf = size / 2;
  for (int i = 0; i < size; i++) {
    for (int j = 0; j < size; j++) {
      double r2 = (i - kHalf) * (i - kHalf) + (j - kHalf) * (j - kHalf);
      kernel(i, j) = exp(-r2 / (2 * sigma * sigma));
    }
  }
  return kernel / sum(kernel)[0];
}

Mat_<double> RandomChannel(int rows, int cols) {
  Mat_<double> channel(rows, cols);
  RNG rng(11);
  rng.fill(channel, RNG::UNIFORM, 0, 1);
  return channel;
}

}

TEST(ConvolverTest, UniformImageStaysUniform) {
  const Mat_<double> kChannel(40, 60, 0.5);
  const Mat_<double> kKernel = GaussianKernel(15, 3);

  FrequencyDomainConvolver frequency;
  SparseSpatialConvolver sparse(0, false);
  for (const Convolver* convolver :
       vector<const Convolver*>{&frequency, &sparse}) {
    SCOPED_TRACE(convolver->name());

    Mat_<double> output;
    ASSERT_TRUE(convolver->Convolve(kChannel, kKernel,
                                    SimulationOptions::CLAMP, &output));
    ASSERT_EQ(kChannel.size(), output.size());
    EXPECT_LT(norm(output - 0.5, NORM_INF), 1e-9);
  }
}

TEST(ConvolverTest, ZeroEdgesDarkenBorder) {
  const Mat_<double> kChannel(40, 60, 1.0);
  const Mat_<double> kKernel = GaussianKernel(9, 2);

  FrequencyDomainConvolver frequency;
  SparseSpatialConvolver sparse(0, false);
  for (const Convolver* convolver :
       vector<const Convolver*>{&frequency, &sparse}) {
    SCOPED_TRACE(convolver->name());

    Mat_<double> output;
    ASSERT_TRUE(convolver->Convolve(kChannel, kKernel,
                                    SimulationOptions::ZERO, &output));
    EXPECT_LT(output(0, 0), 0.5);
    EXPECT_NEAR(1, output(20, 30), 1e-9);
  }
}

TEST(ConvolverTest, ShiftKernelIsTrueConvolution) {
  Mat_<double> channel = Mat_<double>::zeros(9, 9);
  channel(4, 4) = 1;

  // Weight at dx = +1, dy = +2 moves the point right and down.
  Mat_<double> kernel = Mat_<double>::zeros(5, 5);
  kernel(4, 3) = 1;

  FrequencyDomainConvolver frequency;
  SparseSpatialConvolver sparse(0, false);
  for (const Convolver* convolver :
       vector<const Convolver*>{&frequency, &sparse}) {
    SCOPED_TRACE(convolver->name());

    Mat_<double> output;
    ASSERT_TRUE(convolver->Convolve(channel, kernel, SimulationOptions::ZERO,
                                    &output));
    EXPECT_NEAR(1, output(6, 5), 1e-9);
    EXPECT_NEAR(1, sum(output)[0], 1e-9);
  }
}

TEST(ConvolverTest, StrategiesAgree) {
  const Mat_<double> kChannel = RandomChannel(50, 70);
  const Mat_<double> kKernel = GaussianKernel(11, 2);

  for (auto edge_mode : {SimulationOptions::CLAMP, SimulationOptions::ZERO}) {
    Mat_<double> frequency_output, sparse_output;
    ASSERT_TRUE(FrequencyDomainConvolver().Convolve(kChannel, kKernel,
                                                    edge_mode,
                                                    &frequency_output));
    ASSERT_TRUE(SparseSpatialConvolver(1e-5, true).Convolve(kChannel, kKernel,
                                                            edge_mode,
                                                            &sparse_output));
    EXPECT_LT(norm(frequency_output, sparse_output, NORM_INF), 1 / 255.0);
  }
}

TEST(ConvolverTest, RejectsEvenKernel) {
  Mat_<double> output;
  EXPECT_FALSE(FrequencyDomainConvolver().Convolve(
      Mat_<double>(10, 10, 1.0), Mat_<double>(4, 4, 1 / 16.0),
      SimulationOptions::CLAMP, &output));
}

TEST(SparseSpatialConvolverTest, ExtractTapsPreservesSum) {
  Mat_<double> kernel = Mat_<double>::zeros(3, 3);
  kernel(1, 1) = 0.9;
  kernel(0, 2) = 0.099;
  kernel(2, 0) = 0.001;

  vector<SparseSpatialConvolver::Tap> taps;
  SparseSpatialConvolver::ExtractTaps(kernel, 0.01, &taps);
  ASSERT_EQ(2u, taps.size());

  double total = 0;
  for (const auto& tap : taps) total += tap.weight;
  EXPECT_NEAR(1, total, 1e-12);

  EXPECT_EQ(1, taps[0].dx);
  EXPECT_EQ(-1, taps[0].dy);
  EXPECT_EQ(0, taps[1].dx);
  EXPECT_EQ(0, taps[1].dy);
}

TEST(ConvolutionEngineTest, SelectsStrategy) {
  SimulationOptions options;
  const Mat_<double> kDelta = GaussianKernel(1, 1);
  const Mat_<double> kWide = GaussianKernel(101, 30);

  options.set_convolution_strategy(SimulationOptions::FREQUENCY_DOMAIN);
  EXPECT_EQ("frequency domain",
            ConvolutionEngine(options).SelectConvolver(500, 500, kDelta)
                ->name());

  options.set_convolution_strategy(SimulationOptions::SPARSE_SPATIAL);
  EXPECT_EQ("sparse spatial",
            ConvolutionEngine(options).SelectConvolver(500, 500, kWide)
                ->name());

  options.set_convolution_strategy(SimulationOptions::AUTO);
  ConvolutionEngine engine(options);
  EXPECT_EQ("sparse spatial",
            engine.SelectConvolver(500, 500, kDelta)->name());
  EXPECT_EQ("frequency domain",
            engine.SelectConvolver(500, 500, kWide)->name());
}

TEST(ConvolutionEngineTest, ConvolvesColorChannels) {
  Mat source(20, 30, CV_64FC4, Scalar(0.25, 0.5, 0.75, 0));

  SimulationOptions options;
  ConvolutionEngine engine(options);

  Mat output;
  ASSERT_TRUE(engine.Convolve(source, {GaussianKernel(5, 1)}, 2, &output));
  ASSERT_EQ(CV_64FC4, output.type());

  Vec4d pixel = output.at<Vec4d>(10, 15);
  EXPECT_NEAR(0.5, pixel[0], 1e-9);
  EXPECT_NEAR(1.0, pixel[1], 1e-9);
  EXPECT_NEAR(1.5, pixel[2], 1e-9);
  EXPECT_EQ(1, pixel[3]);
}

TEST(ConvolutionEngineTest, ClampsOutput) {
  Mat source(10, 10, CV_64FC4, Scalar(1, 1, 1, 1));
  ConvolutionEngine engine((SimulationOptions()));

  Mat output;
  ASSERT_TRUE(engine.Convolve(source, {GaussianKernel(3, 1)}, 1e6, &output));

  double max_value;
  minMaxIdx(output.reshape(1), nullptr, &max_value);
  EXPECT_EQ(ConvolutionEngine::kMaxOutputValue, max_value);
}

TEST(ConvolutionEngineTest, RejectsInvalidInput) {
  ConvolutionEngine engine((SimulationOptions()));
  Mat output;

  Mat source(10, 10, CV_64FC4, Scalar::all(1));
  EXPECT_FALSE(engine.Convolve(source, {}, 1, &output));
  EXPECT_FALSE(engine.Convolve(
      source, {GaussianKernel(3, 1), GaussianKernel(3, 1)}, 1, &output));

  Mat bytes(10, 10, CV_8UC4, Scalar::all(1));
  EXPECT_FALSE(engine.Convolve(bytes, {GaussianKernel(3, 1)}, 1, &output));
}
