#include <gtest/gtest.h>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

#include "musedna/wav_io.hpp"

using namespace musedna;

namespace {

class WavIoTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() / "musedna_wav_io_test";
    std::filesystem::remove_all(dir_);
  }
  void TearDown() override { std::filesystem::remove_all(dir_); }

  std::filesystem::path dir_;
};

void put_u16(std::ofstream &out, uint16_t v) {
  const char b[2] = {static_cast<char>(v & 0xFF), static_cast<char>(v >> 8)};
  out.write(b, 2);
}

void put_u32(std::ofstream &out, uint32_t v) {
  for (int i = 0; i < 4; ++i) {
    const char b = static_cast<char>((v >> (8 * i)) & 0xFF);
    out.write(&b, 1);
  }
}

} // namespace

TEST_F(WavIoTest, Pcm16RoundTripCreatesDirectories) {
  const auto path = dir_ / "nested" / "out.wav";
  const std::vector<int16_t> pcm = {0, 16384, -16384, 32767, -32768};
  WavIo::write_pcm16(path, pcm, 44100);
  ASSERT_TRUE(std::filesystem::exists(path));
  EXPECT_EQ(std::filesystem::file_size(path), 44u + 2u * pcm.size());

  const auto wav = WavIo::load(path);
  EXPECT_EQ(wav.sample_rate_hz, 44100u);
  EXPECT_EQ(wav.channels, 1);
  ASSERT_EQ(wav.samples.size(), pcm.size());
  EXPECT_FLOAT_EQ(wav.samples[1], 0.5f);
  EXPECT_FLOAT_EQ(wav.samples[2], -0.5f);
  EXPECT_FLOAT_EQ(wav.samples[4], -1.0f);
}

TEST_F(WavIoTest, StereoFloatWithExtraChunkIsMixedToMono) {
  std::filesystem::create_directories(dir_);
  const auto path = dir_ / "stereo.wav";
  const std::vector<float> frames = {0.5f, 0.25f, -1.0f, 0.0f};
  {
    std::ofstream out(path, std::ios::binary);
    out.write("RIFF", 4);
    put_u32(out, 4 + 24 + 12 + 8 + 16);
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    put_u32(out, 16);
    put_u16(out, 3);
    put_u16(out, 2);
    put_u32(out, 22050);
    put_u32(out, 22050 * 8);
    put_u16(out, 8);
    put_u16(out, 32);
    out.write("LIST", 4);
    put_u32(out, 3);
    out.write("abc\0", 4); // 3 bytes + pad
    out.write("data", 4);
    put_u32(out, 16);
    for (float v : frames) {
      uint32_t bits;
      std::memcpy(&bits, &v, sizeof(bits));
      put_u32(out, bits);
    }
  }
  const auto wav = WavIo::load(path);
  EXPECT_EQ(wav.sample_rate_hz, 22050u);
  EXPECT_EQ(wav.channels, 2);
  ASSERT_EQ(wav.samples.size(), 2u);
  EXPECT_FLOAT_EQ(wav.samples[0], 0.375f);
  EXPECT_FLOAT_EQ(wav.samples[1], -0.5f);
}

TEST_F(WavIoTest, LoadErrors) {
  EXPECT_THROW(WavIo::load(dir_ / "missing.wav"), std::runtime_error);

  std::filesystem::create_directories(dir_);
  const auto junk = dir_ / "junk.wav";
  {
    std::ofstream out(junk, std::ios::binary);
    out << "this is not a wave file at all";
  }
  EXPECT_THROW(WavIo::load(junk), std::runtime_error);

  const auto truncated = dir_ / "truncated.wav";
  {
    std::ofstream out(truncated, std::ios::binary);
    out.write("RIFF", 4);
    put_u32(out, 100);
    out.write("WAVE", 4);
  }
  EXPECT_THROW(WavIo::load(truncated), std::runtime_error);
}

TEST_F(WavIoTest, OversizedChunksAreRejected) {
  std::filesystem::create_directories(dir_);

  // fmt chunk claiming 0xFFFFFFFF bytes in a 36-byte file.
  const auto huge_fmt = dir_ / "huge_fmt.wav";
  {
    std::ofstream out(huge_fmt, std::ios::binary);
    out.write("RIFF", 4);
    put_u32(out, 28);
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    put_u32(out, 0xFFFFFFFFu);
    put_u16(out, 1);
    put_u16(out, 1);
    put_u32(out, 44100);
    put_u32(out, 88200);
  }
  EXPECT_THROW(WavIo::load(huge_fmt), std::runtime_error);

  // Valid fmt, data chunk declaring ~4 GiB but carrying 4 bytes.
  const auto huge_data = dir_ / "huge_data.wav";
  {
    std::ofstream out(huge_data, std::ios::binary);
    out.write("RIFF", 4);
    put_u32(out, 40);
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    put_u32(out, 16);
    put_u16(out, 1);
    put_u16(out, 1);
    put_u32(out, 44100);
    put_u32(out, 88200);
    put_u16(out, 2);
    put_u16(out, 16);
    out.write("data", 4);
    put_u32(out, 0xFFFFFFF0u);
    put_u16(out, 100);
    put_u16(out, 200);
  }
  EXPECT_THROW(WavIo::load(huge_data), std::runtime_error);

  // Unknown chunk running past the end of the file.
  const auto huge_list = dir_ / "huge_list.wav";
  {
    std::ofstream out(huge_list, std::ios::binary);
    out.write("RIFF", 4);
    put_u32(out, 12);
    out.write("WAVE", 4);
    out.write("LIST", 4);
    put_u32(out, 0x7FFFFFFFu);
  }
  EXPECT_THROW(WavIo::load(huge_list), std::runtime_error);
}
