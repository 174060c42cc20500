#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "animation_sampler.hpp"

using namespace propanim;

namespace {
// Returns fixed data and counts the accessor reads
class CountingReader : public FloatAccessorReader
{
public:
  std::optional<AnimationError> readFloatAccessor(int accessorIndex, std::vector<float>& output) const override
  {
    reads++;
    std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
    if(accessorIndex == failingAccessor)
      return AnimationError{ErrorCode::eAccessorRead, "/accessors/" + std::to_string(accessorIndex) + ": failed"};
    output = accessorIndex == 0 ? std::vector<float>{0.0f, 1.0f} : std::vector<float>{10.0f, 20.0f};
    return std::nullopt;
  }

  mutable std::atomic<int> reads{0};
  int                      delayMs         = 0;
  int                      failingAccessor = -1;
};
}  // namespace

TEST(AnimationSampler, DecodesInputAndOutput)
{
  CountingReader   reader;
  AnimationSampler sampler(0, 0, 1, "STEP");

  SamplerDecodeResult result = sampler.decode(reader, "/animations/0/samplers/0").get();
  ASSERT_FALSE(result.error.has_value());
  ASSERT_NE(result.data, nullptr);
  EXPECT_EQ(result.data->input, (std::vector<float>{0.0f, 1.0f}));
  EXPECT_EQ(result.data->output, (std::vector<float>{10.0f, 20.0f}));
  EXPECT_EQ(result.data->interpolation, Interpolation::eStep);
}

TEST(AnimationSampler, EmptyInterpolationIsLinear)
{
  CountingReader   reader;
  AnimationSampler sampler(0, 0, 1, "");

  SamplerDecodeResult result = sampler.decode(reader, "ctx").get();
  ASSERT_NE(result.data, nullptr);
  EXPECT_EQ(result.data->interpolation, Interpolation::eLinear);
}

TEST(AnimationSampler, SequentialDecodesShareOneRead)
{
  CountingReader   reader;
  AnimationSampler sampler(0, 0, 1, "LINEAR");

  SamplerDecodeResult first  = sampler.decode(reader, "ctx").get();
  SamplerDecodeResult second = sampler.decode(reader, "ctx").get();
  EXPECT_EQ(first.data, second.data);
  EXPECT_EQ(sampler.decodeCount(), 1u);
  EXPECT_EQ(reader.reads.load(), 2);  // Input and output, once
}

TEST(AnimationSampler, ConcurrentDecodesShareOneRead)
{
  CountingReader reader;
  reader.delayMs = 20;
  AnimationSampler sampler(0, 0, 1, "LINEAR");

  std::vector<std::shared_ptr<const SamplerData>> results(8);
  std::vector<std::thread>                        threads;
  for(size_t i = 0; i < results.size(); i++)
  {
    threads.emplace_back([&, i]() { results[i] = sampler.decode(reader, "ctx", std::launch::async).get().data; });
  }
  for(std::thread& thread : threads)
  {
    thread.join();
  }

  EXPECT_EQ(sampler.decodeCount(), 1u);
  for(const auto& data : results)
  {
    EXPECT_EQ(data, results[0]);
  }
}

TEST(AnimationSampler, InvalidInterpolation)
{
  CountingReader   reader;
  AnimationSampler sampler(2, 0, 1, "SMOOTH");

  SamplerDecodeResult result = sampler.decode(reader, "/animations/0/samplers/2").get();
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, ErrorCode::eMalformedAnimation);
  EXPECT_EQ(result.error->message, "/animations/0/samplers/2/interpolation: Invalid value (SMOOTH)");
  EXPECT_EQ(result.data, nullptr);
  EXPECT_EQ(sampler.decodeCount(), 0u);
  EXPECT_EQ(reader.reads.load(), 0);
}

TEST(AnimationSampler, FailedDecodeIsCached)
{
  CountingReader reader;
  reader.failingAccessor = 1;
  AnimationSampler sampler(0, 0, 1, "LINEAR");

  SamplerDecodeResult first = sampler.decode(reader, "ctx").get();
  ASSERT_TRUE(first.error.has_value());
  EXPECT_EQ(first.error->code, ErrorCode::eAccessorRead);

  SamplerDecodeResult second = sampler.decode(reader, "ctx").get();
  ASSERT_TRUE(second.error.has_value());
  EXPECT_EQ(second.error->message, first.error->message);
  EXPECT_EQ(sampler.decodeCount(), 1u);
}

TEST(AnimationSampler, FromGltfSampler)
{
  tinygltf::AnimationSampler gltfSampler;
  gltfSampler.input         = 0;
  gltfSampler.output        = 1;
  gltfSampler.interpolation = "CUBICSPLINE";

  AnimationSampler sampler(4, gltfSampler);
  EXPECT_EQ(sampler.index(), 4);
  EXPECT_EQ(sampler.interpolation(), "CUBICSPLINE");
}

TEST(AnimationSampler, ReadErrorNamesSampler)
{
  CountingReader reader;
  reader.failingAccessor = 0;
  AnimationSampler sampler(1, 0, 1, "STEP");

  SamplerDecodeResult result = sampler.decode(reader, "/animations/2/samplers/1").get();
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, ErrorCode::eAccessorRead);
  EXPECT_EQ(result.error->message, "/animations/2/samplers/1: /accessors/0: failed");
  EXPECT_EQ(reader.reads.load(), 1);
}
