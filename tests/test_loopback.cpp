#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>
#include <span>
#include <string>
#include <vector>

#include "musedna/codec.hpp"
#include "musedna/debug.hpp"
#include "musedna/resampler.hpp"
#include "musedna/rx/decoder.hpp"
#include "musedna/tx/encoder.hpp"
#include "musedna/tx/tone_synth.hpp"
#include "musedna/utils/reed_solomon.hpp"
#include "musedna/utils/sequence.hpp"
#include "musedna/wav_io.hpp"

using namespace musedna;

namespace {

// Replace `count` distinct symbols of codeword `block` with different values.
void corrupt_block(std::vector<uint8_t> &symbols, size_t block, int count, std::mt19937 &rng) {
  const size_t base = HEADER_SYMBOLS + block * RS_N;
  std::vector<size_t> pos(RS_N);
  for (size_t i = 0; i < RS_N; ++i)
    pos[i] = base + i;
  std::shuffle(pos.begin(), pos.end(), rng);
  std::uniform_int_distribution<int> delta(1, 31);
  for (int i = 0; i < count; ++i)
    symbols[pos[i]] = static_cast<uint8_t>(symbols[pos[i]] ^ delta(rng));
}

class CodecFileTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() / "musedna_loopback_test";
    std::filesystem::remove_all(dir_);
  }
  void TearDown() override { std::filesystem::remove_all(dir_); }

  std::filesystem::path dir_;
};

} // namespace

TEST(Loopback, SingleBlockLayout) {
  const std::string seq = "ATGCATGCATGCATGCATGCATG";
  tx::Encoder enc;
  const auto res = enc.encode(seq);
  ASSERT_TRUE(res.success);
  EXPECT_EQ(res.sequence_length, 23u);
  EXPECT_EQ(res.padding, 0u);
  EXPECT_EQ(res.block_count, 1u);
  ASSERT_EQ(res.symbols.size(), 35u);
  EXPECT_EQ(std::vector<uint8_t>(res.symbols.begin(), res.symbols.begin() + 4),
            (std::vector<uint8_t>{0, 0, 1, 7}));
  EXPECT_EQ(res.symbols[4], 0);
  EXPECT_EQ(res.symbols[5], 1);
  EXPECT_EQ(res.symbols[6], 2);
  EXPECT_EQ(res.symbols[7], 3);
  EXPECT_EQ(res.samples.size(), 35u * 8820u);

  rx::Decoder dec;
  const auto out = dec.decode_samples(std::span<const int16_t>(res.samples));
  ASSERT_TRUE(out.success) << out.failure_reason;
  EXPECT_EQ(out.sequence, seq);
  EXPECT_EQ(out.corrected_symbols, 0u);
  EXPECT_EQ(out.stage, rx::DecodeStage::Done);
  EXPECT_EQ(out.status_message(), "Verified (0 errors corrected)");
}

TEST(Loopback, SanitizesAndPads) {
  tx::Encoder enc;
  const auto res = enc.encode("at gc\nNNa-t");
  ASSERT_TRUE(res.success);
  EXPECT_EQ(res.sequence_length, 6u);
  EXPECT_EQ(res.padding, 17u);
  EXPECT_EQ(res.symbols.size(), 4u + 31u);

  rx::Decoder dec;
  const auto out = dec.decode_samples(std::span<const int16_t>(res.samples));
  ASSERT_TRUE(out.success);
  EXPECT_EQ(out.sequence, "ATGCAT");
  EXPECT_EQ(out.declared_length, 6u);
}

TEST(Loopback, RandomSequences) {
  tx::Encoder enc;
  rx::Decoder dec;
  uint32_t seed = 1;
  for (size_t len : {1u, 22u, 24u, 46u, 100u}) {
    const auto seq = utils::random_sequence(len, seed++);
    const auto res = enc.encode(seq);
    ASSERT_TRUE(res.success);
    EXPECT_EQ(res.block_count, (len + RS_K - 1) / RS_K);
    const auto out = dec.decode_samples(std::span<const int16_t>(res.samples));
    ASSERT_TRUE(out.success) << "len=" << len << " " << out.failure_reason;
    EXPECT_EQ(out.sequence, seq);
    EXPECT_EQ(out.corrected_symbols, 0u);
  }
}

TEST(Loopback, TrailingAIsKeptByHeader) {
  tx::Encoder enc;
  rx::Decoder dec;
  const auto res = enc.encode_symbols("GGGAAA");
  ASSERT_TRUE(res.success);
  const auto out = dec.decode_symbols(res.symbols);
  ASSERT_TRUE(out.success);
  EXPECT_EQ(out.sequence, "GGGAAA");
}

TEST(Loopback, CorrectsFourSymbolErrorsPerBlock) {
  const auto seq = utils::random_sequence(46, 77);
  tx::Encoder enc;
  auto res = enc.encode_symbols(seq);
  ASSERT_TRUE(res.success);
  ASSERT_EQ(res.block_count, 2u);

  std::mt19937 rng(3);
  corrupt_block(res.symbols, 0, 4, rng);
  corrupt_block(res.symbols, 1, 3, rng);
  const auto audio = tx::render_symbols(res.symbols, enc.config());

  rx::Decoder dec;
  const auto out = dec.decode_samples(std::span<const int16_t>(audio));
  ASSERT_TRUE(out.success) << out.failure_reason;
  EXPECT_EQ(out.sequence, seq);
  EXPECT_EQ(out.corrected_symbols, 7u);
  EXPECT_EQ(out.status_message(), "Verified (7 errors corrected)");
}

TEST(Loopback, UncorrectableBlockFailsWholeDecode) {
  const auto seq = utils::random_sequence(46, 5);
  tx::Encoder enc;
  const auto clean = enc.encode_symbols(seq);
  ASSERT_TRUE(clean.success);

  // Five errors usually exceed the decoder; pick a pattern it rejects.
  std::vector<uint8_t> symbols;
  bool found = false;
  for (uint32_t s = 0; s < 200 && !found; ++s) {
    std::mt19937 rng(s);
    symbols = clean.symbols;
    corrupt_block(symbols, 1, 5, rng);
    const std::span<const uint8_t> block(symbols.data() + HEADER_SYMBOLS + RS_N, RS_N);
    found = !utils::rs_decode_block(block).has_value();
  }
  ASSERT_TRUE(found);

  const auto audio = tx::render_symbols(symbols, enc.config());
  rx::Decoder dec;
  const auto out = dec.decode_samples(std::span<const int16_t>(audio));
  EXPECT_FALSE(out.success);
  EXPECT_EQ(out.status, rx::DecodeStatus::DecodingFailure);
  EXPECT_EQ(out.failed_stage, rx::DecodeStage::BlockDecoding);
  EXPECT_EQ(out.failed_block, 2u);
  EXPECT_TRUE(out.sequence.empty());
  EXPECT_EQ(out.status_message(), "Error: Too many errors to correct in block 2.");
  EXPECT_EQ(debug::last_fail_step, debug::FAIL_BLOCK_DECODE);
}

TEST(Loopback, TooShortForHeader) {
  CodecConfig cfg;
  const std::vector<uint8_t> three = {0, 0, 1};
  const auto audio = tx::render_symbols(three, cfg);
  rx::Decoder dec(cfg);
  const auto out = dec.decode_samples(std::span<const int16_t>(audio));
  EXPECT_FALSE(out.success);
  EXPECT_EQ(out.status, rx::DecodeStatus::HeaderError);
  EXPECT_EQ(out.failure_reason, "Error: Audio too short to contain a valid header.");
  EXPECT_EQ(out.detected_symbols.size(), 3u);
  EXPECT_EQ(debug::last_fail_step, debug::FAIL_HEADER);
}

TEST(Loopback, HeaderOnlyDecodesToEmpty) {
  rx::Decoder dec;
  const std::vector<uint8_t> header = {0, 0, 0, 5};
  const auto out = dec.decode_symbols(header);
  ASSERT_TRUE(out.success);
  EXPECT_TRUE(out.sequence.empty());
  EXPECT_EQ(out.block_count, 0u);
}

TEST(Loopback, InflatedHeaderIsClampedToData) {
  const std::string seq = "ATGCATGCATGCATGCATGCATG";
  tx::Encoder enc;
  auto res = enc.encode_symbols(seq);
  ASSERT_TRUE(res.success);
  res.symbols[2] = 5; // 0x0057 instead of 0x0017

  rx::Decoder dec;
  const auto out = dec.decode_symbols(res.symbols);
  ASSERT_TRUE(out.success);
  EXPECT_EQ(out.declared_length, 0x57u);
  EXPECT_EQ(out.sequence, seq);
}

TEST(Loopback, ShortTrailingBlockIsZeroPadded) {
  tx::Encoder enc;
  const auto res = enc.encode_symbols("CCCCCCCCCC");
  ASSERT_TRUE(res.success);
  // Drop the last parity symbol: it counts as one error in the padded block.
  std::vector<uint8_t> symbols(res.symbols.begin(), res.symbols.end() - 1);
  rx::Decoder dec;
  const auto out = dec.decode_symbols(symbols);
  ASSERT_TRUE(out.success);
  EXPECT_EQ(out.sequence, "CCCCCCCCCC");
  EXPECT_LE(out.corrected_symbols, 1u);
}

TEST(Loopback, RejectsUnusableInput) {
  tx::Encoder enc;
  const auto empty = enc.encode_symbols("nnnn 1234");
  EXPECT_FALSE(empty.success);
  EXPECT_EQ(empty.status, tx::EncodeStatus::InputError);
  EXPECT_EQ(empty.failure_reason, "Error: No valid DNA bases found.");
  EXPECT_TRUE(empty.symbols.empty());

  const auto too_long = enc.encode_symbols(std::string(MAX_SEQUENCE_LENGTH + 1, 'G'));
  EXPECT_FALSE(too_long.success);
  EXPECT_EQ(too_long.status, tx::EncodeStatus::InputError);

  const auto max_len = enc.encode_symbols(std::string(MAX_SEQUENCE_LENGTH, 'G'));
  EXPECT_TRUE(max_len.success);
  EXPECT_EQ(std::vector<uint8_t>(max_len.symbols.begin(), max_len.symbols.begin() + 4),
            (std::vector<uint8_t>{15, 15, 15, 15}));
}

TEST(Loopback, StatusNames) {
  EXPECT_STREQ(rx::to_string(rx::DecodeStatus::DecodingFailure), "DecodingFailure");
  EXPECT_STREQ(rx::to_string(rx::DecodeStage::HeaderParsing), "HeaderParsing");
}

TEST_F(CodecFileTest, EncodeDecodeThroughWavFile) {
  const auto path = dir_ / "song.wav";
  const std::string seq = utils::random_sequence(30, 9);
  ASSERT_TRUE(musedna::encode(seq, path));
  ASSERT_TRUE(std::filesystem::exists(path));

  const auto [decoded, status] = musedna::decode(path);
  EXPECT_EQ(decoded, seq);
  EXPECT_EQ(status, "Verified (0 errors corrected)");
}

TEST_F(CodecFileTest, RejectedInputWritesNothing) {
  const auto path = dir_ / "empty.wav";
  testing::internal::CaptureStderr();
  EXPECT_FALSE(musedna::encode("xyz", path));
  const std::string err = testing::internal::GetCapturedStderr();
  EXPECT_NE(err.find("Error: No valid DNA bases found."), std::string::npos);
  EXPECT_FALSE(std::filesystem::exists(path));

  tx::Encoder enc;
  const auto res = enc.encode_to_file("", path);
  EXPECT_EQ(res.status, tx::EncodeStatus::InputError);
  EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(CodecFileTest, LoadFailuresAreReported) {
  const auto [seq, status] = musedna::decode(dir_ / "missing.wav");
  EXPECT_TRUE(seq.empty());
  EXPECT_EQ(status.rfind("Error", 0), 0u);

  std::filesystem::create_directories(dir_);
  const auto corrupt = dir_ / "corrupt.wav";
  {
    std::ofstream out(corrupt, std::ios::binary);
    const unsigned char bytes[] = {'R', 'I', 'F', 'F', 28, 0, 0, 0, 'W', 'A', 'V', 'E',
                                   'f', 'm', 't', ' ', 0xFF, 0xFF, 0xFF, 0xFF};
    out.write(reinterpret_cast<const char *>(bytes), sizeof(bytes));
  }
  rx::Decoder dec;
  const auto out = dec.decode_file(corrupt);
  EXPECT_FALSE(out.success);
  EXPECT_EQ(out.status, rx::DecodeStatus::AudioLoadError);
  EXPECT_EQ(out.failed_stage, rx::DecodeStage::Loading);
  EXPECT_EQ(debug::last_fail_step, debug::FAIL_AUDIO_LOAD);
}

TEST_F(CodecFileTest, OtherSampleRatesAreResampled) {
  const std::string seq = utils::random_sequence(40, 21);
  tx::Encoder enc;
  const auto res = enc.encode(seq);
  ASSERT_TRUE(res.success);
  std::vector<float> audio(res.samples.size());
  for (size_t i = 0; i < audio.size(); ++i)
    audio[i] = static_cast<float>(res.samples[i]) / 32768.0f;

  rx::Decoder dec;
  for (uint32_t rate : {22050u, 48000u}) {
    const auto moved = resample(audio, SAMPLE_RATE_HZ, rate);
    std::vector<int16_t> pcm(moved.size());
    for (size_t i = 0; i < moved.size(); ++i)
      pcm[i] = static_cast<int16_t>(std::clamp(moved[i], -1.0f, 1.0f) * 32767.0f);
    const auto path = dir_ / ("song_" + std::to_string(rate) + ".wav");
    WavIo::write_pcm16(path, pcm, rate);

    const auto out = dec.decode_file(path);
    ASSERT_TRUE(out.success) << "rate=" << rate << " " << out.failure_reason;
    EXPECT_EQ(out.sequence, seq);
    EXPECT_EQ(out.block_count, 2u);
  }
}
