// Tests for computing and resampling point spread functions.
// Author: Philip Salvaggio

#include "base/aperture_parameters.pb.h"
#include "base/complex_field.h"
#include "base/opencv_utils.h"
#include "base/point_spread_function.h"
#include "base/simulation_config.pb.h"
#include "base/simulator.h"

#include <gtest/gtest.h>
#include <opencv2/core/core.hpp>

#include <cmath>
#include <vector>

using namespace std;
using namespace cv;
using namespace apsim;

namespace {

ApertureParameters Pinhole(double diameter) {
  ApertureParameters params;
  params.set_type(ApertureParameters::PINHOLE);
  params.set_diameter(diameter);
  return params;
}

}

TEST(PointSpreadFunctionTest, AllTypesSumToOne) {
  const Mat kWhite(32, 32, CV_8UC4, Scalar(255, 255, 255, 255));

  Simulator simulator;
  CameraParameters camera;
  SimulationOptions options;

  for (int type = ApertureParameters::ApertureType_MIN;
       type <= ApertureParameters::ApertureType_MAX; type++) {
    ApertureParameters params;
    params.set_type(static_cast<ApertureParameters::ApertureType>(type));
    params.set_diameter(2);
    if (type == ApertureParameters::FREEFORM) {
      PathPoint* point = params.add_path();
      point->set_x(-0.5);
      point = params.add_path();
      point->set_x(0.5);
    }
    SCOPED_TRACE(ApertureParameters::ApertureType_Name(params.type()));

    WavelengthPsf result;
    ASSERT_TRUE(simulator.ComputePsf(params, camera, options, 550, 40,
                                     kWhite, &result));
    EXPECT_FALSE(result.psf.is_delta());
    EXPECT_NEAR(1, sum(result.psf.data())[0], 1e-9);

    double min_value;
    minMaxIdx(result.psf.data(), &min_value);
    EXPECT_GE(min_value, 0);
  }
}

TEST(PointSpreadFunctionTest, GeometricPsfIsNormalizedMask) {
  Simulator simulator;
  CameraParameters camera;
  SimulationOptions options;
  options.set_render_diffraction(false);

  ApertureParameters params;
  params.set_type(ApertureParameters::ANNULAR);
  params.set_diameter(1);

  WavelengthPsf result;
  ASSERT_TRUE(simulator.ComputePsf(params, camera, options, 550, 50, Mat(),
                                   &result));

  double mask_sum = sum(result.mask)[0];
  ASSERT_GT(mask_sum, 0);
  Mat_<double> expected = result.mask / mask_sum;
  EXPECT_LT(norm(expected, result.psf.data(), NORM_INF), 1e-15);
  EXPECT_NEAR(mask_sum, result.psf.normalization_sum(), 1e-9);
}

TEST(PointSpreadFunctionTest, ClosedApertureFallsBackToDelta) {
  PointSpreadFunction psf;
  ASSERT_TRUE(PointSpreadFunction::FromMask(Mat_<double>::zeros(64, 64),
                                            &psf));
  EXPECT_TRUE(psf.is_delta());
  EXPECT_EQ(0, psf.normalization_sum());
  EXPECT_EQ(1, psf.data()(32, 32));
  EXPECT_EQ(1, sum(psf.data())[0]);

  // A CUSTOM aperture without a bitmap blocks all light.
  Simulator simulator;
  ApertureParameters params;
  params.set_type(ApertureParameters::CUSTOM);
  params.set_diameter(1);

  WavelengthPsf result;
  ASSERT_TRUE(simulator.ComputePsf(params, CameraParameters(),
                                   SimulationOptions(), 550, 50, Mat(),
                                   &result));
  EXPECT_TRUE(result.psf.is_delta());
  EXPECT_EQ(1, result.psf.data()(result.grid.center(), result.grid.center()));
}

TEST(PointSpreadFunctionTest, PinholeShowsAiryPattern) {
  Simulator simulator;
  WavelengthPsf result;
  ASSERT_TRUE(simulator.ComputePsf(Pinhole(0.3), CameraParameters(),
                                   SimulationOptions(), 550, 100, Mat(),
                                   &result));
  ASSERT_EQ(512, result.grid.size);

  const Mat_<double>& psf = result.psf.data();
  const int kCenter = result.grid.center();

  Point max_loc;
  minMaxLoc(psf, nullptr, nullptr, nullptr, &max_loc);
  EXPECT_EQ(kCenter, max_loc.x);
  EXPECT_EQ(kCenter, max_loc.y);

  vector<double> profile;
  GetAzimuthalProfile(psf, Point2d(kCenter, kCenter), &profile);
  ASSERT_GT(profile.size(), 40u);

  // 1.22 lambda f / D
  double expected = 1.22 * 550e-6 * 50 / 0.3 * result.grid.pixels_per_mm;
  EXPECT_NEAR(15.6, expected, 0.1);

  // At a Fresnel number near 1 the first dark ring is filled in to a
  // shoulder of the profile. Its center is the flattest point outside the
  // central peak.
  int first_ring = -1;
  double flattest = 1e300;
  for (int r = 1; r < 1.5 * expected; r++) {
    double slope = fabs(profile[r - 1] - profile[r + 1]);
    if (slope < flattest) {
      flattest = slope;
      first_ring = r;
    }
  }
  EXPECT_NEAR(expected, first_ring, 1);
  EXPECT_LT(profile[first_ring], 0.2 * profile[0]);

  // Mirror symmetric about the center sample.
  for (int d = 1; d < 40; d++) {
    EXPECT_NEAR(psf(kCenter, kCenter + d), psf(kCenter, kCenter - d),
                1e-9 * psf(kCenter, kCenter));
  }
}

TEST(PointSpreadFunctionTest, ResampleToImageScale) {
  Simulator simulator;
  WavelengthPsf result;
  ASSERT_TRUE(simulator.ComputePsf(Pinhole(0.3), CameraParameters(),
                                   SimulationOptions(), 550, 100, Mat(),
                                   &result));

  // 11/3 mm at 10 pixels/mm rounds to 37 pixels.
  PointSpreadFunction kernel;
  ASSERT_TRUE(result.psf.ResampleToImageScale(result.grid, 10, 1001, &kernel));
  ASSERT_EQ(37, kernel.size());
  EXPECT_NEAR(1, sum(kernel.data())[0], 1e-12);

  Point max_loc;
  minMaxLoc(kernel.data(), nullptr, nullptr, nullptr, &max_loc);
  EXPECT_EQ(18, max_loc.x);
  EXPECT_EQ(18, max_loc.y);

  // Even sizes are rounded up to the next odd size.
  ASSERT_TRUE(result.psf.ResampleToImageScale(result.grid, 12, 1001, &kernel));
  EXPECT_EQ(45, kernel.size());

  // Coarse sensors collapse the kernel to a single sample.
  ASSERT_TRUE(result.psf.ResampleToImageScale(result.grid, 0.1, 1001, &kernel));
  EXPECT_EQ(1, kernel.size());
  EXPECT_NEAR(1, kernel.data()(0, 0), 1e-12);

  EXPECT_FALSE(result.psf.ResampleToImageScale(result.grid, 0, 1001, &kernel));
  EXPECT_FALSE(result.psf.ResampleToImageScale(result.grid, 10, 0, &kernel));
}

TEST(PointSpreadFunctionTest, ResampleLimitsKernelSize) {
  Simulator simulator;
  WavelengthPsf result;
  ASSERT_TRUE(simulator.ComputePsf(Pinhole(0.3), CameraParameters(),
                                   SimulationOptions(), 550, 100, Mat(),
                                   &result));

  // 37 pixels unbounded, cropped to the central 11.
  PointSpreadFunction kernel;
  ASSERT_TRUE(result.psf.ResampleToImageScale(result.grid, 10, 11, &kernel));
  ASSERT_EQ(11, kernel.size());
  EXPECT_NEAR(1, sum(kernel.data())[0], 1e-12);

  Point max_loc;
  minMaxLoc(kernel.data(), nullptr, nullptr, nullptr, &max_loc);
  EXPECT_EQ(5, max_loc.x);
  EXPECT_EQ(5, max_loc.y);
  for (int d = 1; d <= 5; d++) {
    EXPECT_NEAR(kernel.data()(5, 5 + d), kernel.data()(5, 5 - d), 1e-12);
  }

  // Even limits are rounded up to the next odd size.
  ASSERT_TRUE(result.psf.ResampleToImageScale(result.grid, 10, 10, &kernel));
  EXPECT_EQ(11, kernel.size());

  // A slit 1 um wide has a window of 1.1 m, that would be a kernel of
  // 11000 pixels at this density.
  ApertureParameters slit;
  slit.set_type(ApertureParameters::SLIT);
  slit.set_diameter(2);
  slit.set_slit_width(0.001);
  ASSERT_TRUE(simulator.ComputePsf(slit, CameraParameters(),
                                   SimulationOptions(), 550, 10, Mat(),
                                   &result));
  ASSERT_TRUE(result.psf.ResampleToImageScale(result.grid, 10, 65, &kernel));
  EXPECT_EQ(65, kernel.size());
  EXPECT_NEAR(1, sum(kernel.data())[0], 1e-12);
}

TEST(PointSpreadFunctionTest, NonFiniteFieldFails) {
  ComplexField field(64);
  field.real_part()(10, 10) = NAN;

  PointSpreadFunction psf;
  EXPECT_FALSE(PointSpreadFunction::FromField(field, &psf));

  Mat_<double> mask = Mat_<double>::zeros(64, 64);
  mask(3, 4) = INFINITY;
  EXPECT_FALSE(PointSpreadFunction::FromMask(mask, &psf));
}
