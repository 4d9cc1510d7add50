// Tests for reading simulation configurations.
// Author: Philip Salvaggio

#include "base/apsim_init.h"
#include "base/filesystem.h"
#include "base/simulation_config.pb.h"
#include "base/str_utils.h"
#include "io/logging.h"
#include "io/protobuf_reader.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

using namespace std;
using namespace apsim;

namespace {

const char kConfig[] =
    "exposure: 2\n"
    "input_image_filename: \"scene.png\"\n"
    "camera {\n"
    "  focal_length: 35\n"
    "  iso: 800\n"
    "}\n"
    "aperture {\n"
    "  type: ZONE_PLATE\n"
    "  diameter: 2\n"
    "  zone_plate_profile: ZONE_SINUSOIDAL\n"
    "}\n"
    "options {\n"
    "  polychromatic: true\n"
    "  convolution_strategy: SPARSE_SPATIAL\n"
    "  rgb_wavelength: [650, 530, 470]\n"
    "}\n";

}

TEST(ConfigTest, ParsesTextFormat) {
  SimulationConfig config;
  ASSERT_TRUE(apsim_io::ProtobufReader::ReadString(kConfig, &config));

  EXPECT_EQ(2, config.exposure());
  EXPECT_EQ("scene.png", config.input_image_filename());
  EXPECT_EQ("output.png", config.output_image_filename());

  EXPECT_EQ(35, config.camera().focal_length());
  EXPECT_EQ(36, config.camera().sensor_width());
  EXPECT_EQ(550, config.camera().wavelength());

  EXPECT_EQ(ApertureParameters::ZONE_PLATE, config.aperture().type());
  EXPECT_EQ(ApertureParameters::ZONE_SINUSOIDAL,
            config.aperture().zone_plate_profile());
  EXPECT_EQ(128, config.aperture().mask_threshold());

  EXPECT_TRUE(config.options().polychromatic());
  EXPECT_TRUE(config.options().render_diffraction());
  EXPECT_EQ(SimulationOptions::SPARSE_SPATIAL,
            config.options().convolution_strategy());
  EXPECT_EQ(SimulationOptions::CLAMP, config.options().edge_mode());
  ASSERT_EQ(3, config.options().rgb_wavelength_size());
  EXPECT_EQ(530, config.options().rgb_wavelength(1));
  EXPECT_EQ(1024, config.options().processing_width());
}

TEST(ConfigTest, RejectsUnknownFields) {
  SimulationConfig config;
  EXPECT_FALSE(apsim_io::ProtobufReader::ReadString("lens: 3\n", &config));
  EXPECT_FALSE(apsim_io::ProtobufReader::ReadString(
      "aperture { type: TELESCOPE }\n", &config));
}

TEST(ConfigTest, PrintConfig) {
  SimulationConfig config;
  ASSERT_TRUE(apsim_io::ProtobufReader::ReadString(kConfig, &config));

  string printed = apsim_io::PrintConfig(config);
  EXPECT_NE(string::npos, printed.find("ZONE_PLATE"));
  EXPECT_NE(string::npos, printed.find("ZONE_SINUSOIDAL"));
  EXPECT_NE(string::npos, printed.find("SPARSE_SPATIAL"));
}

TEST(ConfigTest, ApsimInitReadsFile) {
  const string kFilename = "/tmp/apsim_config_test.txt";
  {
    ofstream ofs(kFilename.c_str());
    ASSERT_TRUE(ofs.is_open());
    ofs << kConfig;
  }

  SimulationConfig config;
  ASSERT_TRUE(ApsimInit(kFilename, &config));
  EXPECT_EQ(ApertureParameters::ZONE_PLATE, config.aperture().type());
  EXPECT_FALSE(config.has_base_directory());
  remove(kFilename.c_str());

  EXPECT_FALSE(ApsimInit("/tmp/apsim_config_test_missing.txt", &config));
  EXPECT_FALSE(ApsimInit(kFilename, nullptr));
}

TEST(StrUtilsTest, Formatting) {
  EXPECT_EQ("psf_550.png", StringPrintf("psf_%d.png", 550));
  EXPECT_EQ("logs/", AppendSlash("logs"));
  EXPECT_EQ("logs/", AppendSlash("logs/"));
}

TEST(FilesystemTest, Paths) {
  EXPECT_TRUE(is_dir("/tmp"));
  EXPECT_EQ("/tmp/", ResolvePath("/tmp"));
  EXPECT_FALSE(is_dir("/tmp/apsim_no_such_directory"));
}
