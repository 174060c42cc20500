#include <gtest/gtest.h>

#include "channel_assembler.hpp"
#include "common/test_utils.hpp"

using namespace propanim;
using namespace propanim_test;

class ChannelAssemblerTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    builder.addMaterial("mat");
    builder.addLight("unbound", false);
  }

  // Adds one sampler over fresh accessors
  void addSampler(const std::vector<float>& input, const std::vector<float>& output, const std::string& interpolation)
  {
    const int in  = builder.addFloatAccessor(input);
    const int out = builder.addFloatAccessor(output);
    samplers.push_back(std::make_unique<AnimationSampler>(static_cast<int>(samplers.size()), in, out, interpolation));
  }

  std::optional<AnimationError> assemble(const PropertyChannel& channel, AssembledChannel* result = nullptr)
  {
    GltfAccessorReader reader(builder.model());
    TargetPathResolver resolver(builder.model());
    ChannelAssembler   assembler(resolver, reader);
    return assembler.assemble(channel, samplers, group, "/animations/0", "/animations/0/channels/" + std::to_string(channel.index), result);
  }

  ModelBuilder                                   builder;
  std::vector<std::unique_ptr<AnimationSampler>> samplers;
  AnimationGroup                                 group{"Fade"};
};

TEST_F(ChannelAssemblerTest, Color4SplitsIntoColorAndAlpha)
{
  addSampler({0.0f, 1.0f}, {1, 0, 0, 1, 0, 0, 1, 0.5f}, "LINEAR");

  AssembledChannel result;
  ASSERT_FALSE(assemble({0, 0, "/materials/0/pbrMetallicRoughness/baseColorFactor"}, &result));

  const auto& animations = group.targetedAnimations();
  ASSERT_EQ(animations.size(), 2u);

  const KeyframeTrack& color = animations[0].track;
  EXPECT_EQ(color.name, "Fade_EXT_property_animation_channel0");
  EXPECT_EQ(color.targetPath, "albedoColor");
  EXPECT_EQ(color.valueType, ValueType::eColor3);
  ASSERT_EQ(color.keys.size(), 2u);
  EXPECT_EQ(std::get<glm::vec3>(color.keys[1].value), glm::vec3(0, 0, 1));

  const KeyframeTrack& alpha = animations[1].track;
  EXPECT_EQ(alpha.name, "Fade_EXT_property_animation_channel0_alpha");
  EXPECT_EQ(alpha.targetPath, "alpha");
  EXPECT_EQ(alpha.valueType, ValueType::eFloat);
  ASSERT_EQ(alpha.keys.size(), 2u);
  EXPECT_FLOAT_EQ(std::get<float>(alpha.keys[0].value), 1.0f);
  EXPECT_FLOAT_EQ(std::get<float>(alpha.keys[1].value), 0.5f);

  for(size_t i = 0; i < color.keys.size(); i++)
  {
    EXPECT_EQ(color.keys[i].frame, alpha.keys[i].frame);
  }
  EXPECT_EQ(animations[0].target, animations[1].target);
  EXPECT_EQ(animations[0].target.type, TargetObject::eMaterial);

  EXPECT_EQ(result.descriptor.valueType, ValueType::eColor4);
  ASSERT_TRUE(result.alphaTrack.has_value());
  ASSERT_NE(result.samplerData, nullptr);
}

TEST_F(ChannelAssemblerTest, CubicSplineColor4Alpha)
{
  // in, value, out per key; alpha is the 4th float of each sample
  addSampler({0.0f}, {0, 0, 0, 0.1f, 1, 1, 1, 0.5f, 0, 0, 0, 0.9f}, "CUBICSPLINE");

  ASSERT_FALSE(assemble({0, 0, "materials/0/pbrMetallicRoughness/baseColorFactor"}));
  const KeyframeTrack& alpha = group.targetedAnimations()[1].track;
  ASSERT_EQ(alpha.keys.size(), 1u);
  EXPECT_FLOAT_EQ(std::get<float>(*alpha.keys[0].inTangent), 0.1f);
  EXPECT_FLOAT_EQ(std::get<float>(alpha.keys[0].value), 0.5f);
  EXPECT_FLOAT_EQ(std::get<float>(*alpha.keys[0].outTangent), 0.9f);
}

TEST_F(ChannelAssemblerTest, TrackNamesAreUnique)
{
  addSampler({0.0f, 1.0f}, {0.0f, 1.0f}, "STEP");

  ASSERT_FALSE(assemble({0, 0, "/materials/0/pbrMetallicRoughness/metallicFactor"}));
  ASSERT_FALSE(assemble({1, 0, "/materials/0/pbrMetallicRoughness/roughnessFactor"}));

  const auto& animations = group.targetedAnimations();
  ASSERT_EQ(animations.size(), 2u);
  EXPECT_NE(animations[0].track.name, animations[1].track.name);
  EXPECT_EQ(animations[0].track.interpolation, Interpolation::eStep);
  EXPECT_EQ(samplers[0]->decodeCount(), 1u);
}

TEST_F(ChannelAssemblerTest, UnresolvedObjectIsNotAttached)
{
  const PropertyPathNode registry = PropertyPathNode::group(
      "", {PropertyPathNode::indexedGroup("widgets", nullptr, {PropertyPathNode::property("weight", ValueType::eFloat, "weight")})});
  addSampler({0.0f, 1.0f}, {0.0f, 1.0f}, "LINEAR");

  GltfAccessorReader reader(builder.model());
  TargetPathResolver resolver(builder.model(), registry);
  ChannelAssembler   assembler(resolver, reader);
  AssembledChannel   result;
  ASSERT_FALSE(assembler.assemble({0, 0, "/widgets/0/weight"}, samplers, group, "/animations/0", "/animations/0/channels/0", &result));

  EXPECT_TRUE(group.targetedAnimations().empty());
  EXPECT_EQ(result.track.keys.size(), 2u);
  EXPECT_FALSE(result.descriptor.object.valid());
}

TEST_F(ChannelAssemblerTest, InvalidSamplerIndex)
{
  addSampler({0.0f}, {0.0f}, "LINEAR");

  std::optional<AnimationError> error = assemble({3, 5, "/materials/0/emissiveFactor"});
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, ErrorCode::eMalformedAnimation);
  EXPECT_EQ(error->message, "/animations/0/channels/3/sampler: Invalid index (5)");
  EXPECT_TRUE(group.targetedAnimations().empty());
}

TEST_F(ChannelAssemblerTest, InvalidTargetPath)
{
  addSampler({0.0f}, {0.0f}, "LINEAR");

  std::optional<AnimationError> error = assemble({0, 0, "/extensions/KHR_lights_punctual/lights/0/intensity"});
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, ErrorCode::eInvalidTargetPath);
  EXPECT_TRUE(group.targetedAnimations().empty());
}

TEST_F(ChannelAssemblerTest, ShortOutputIsRangeError)
{
  addSampler({0.0f, 1.0f}, {1, 1, 1, 1, 1}, "LINEAR");  // Two RGB keys need 6 floats

  std::optional<AnimationError> error = assemble({0, 0, "/materials/0/emissiveFactor"});
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, ErrorCode::eAccessorRange);
  EXPECT_EQ(error->message.rfind("/animations/0/samplers/0: ", 0), 0u);
  EXPECT_TRUE(group.targetedAnimations().empty());
}

TEST_F(ChannelAssemblerTest, SurplusOutputIsIgnored)
{
  addSampler({0.0f}, {0.5f, 0.25f, 0.75f}, "LINEAR");

  ASSERT_FALSE(assemble({0, 0, "/materials/0/pbrMetallicRoughness/metallicFactor"}));
  ASSERT_EQ(group.targetedAnimations().size(), 1u);
  EXPECT_FLOAT_EQ(std::get<float>(group.targetedAnimations()[0].track.keys[0].value), 0.5f);
}

TEST(AnimationGroup, NormalizePadsTracksToCommonRange)
{
  AnimationGroup group("g");

  KeyframeTrack early;
  early.keys = {{0.0f, 1.0f, std::nullopt, std::nullopt}, {1.0f, 2.0f, std::nullopt, std::nullopt}};
  KeyframeTrack late;
  late.valueType     = ValueType::eVector2;
  late.interpolation = Interpolation::eCubicSpline;
  late.keys          = {{2.0f, glm::vec2(3.0f), glm::vec2(1.0f), glm::vec2(1.0f)}};

  group.addTargetedAnimation(early, {TargetObject::eMaterial, 0, -1});
  group.addTargetedAnimation(late, {TargetObject::eMaterial, 0, -1});
  group.normalize();

  EXPECT_TRUE(group.isNormalized());
  EXPECT_FLOAT_EQ(group.from(), 0.0f);
  EXPECT_FLOAT_EQ(group.to(), 2.0f);

  const std::vector<Keyframe>& a = group.targetedAnimations()[0].track.keys;
  ASSERT_EQ(a.size(), 3u);
  EXPECT_FLOAT_EQ(a[2].frame, 2.0f);
  EXPECT_FLOAT_EQ(std::get<float>(a[2].value), 2.0f);

  const std::vector<Keyframe>& b = group.targetedAnimations()[1].track.keys;
  ASSERT_EQ(b.size(), 2u);
  EXPECT_FLOAT_EQ(b[0].frame, 0.0f);
  EXPECT_EQ(std::get<glm::vec2>(b[0].value), glm::vec2(3.0f));
  EXPECT_EQ(std::get<glm::vec2>(*b[0].inTangent), glm::vec2(0.0f));
  EXPECT_EQ(std::get<glm::vec2>(*b[0].outTangent), glm::vec2(0.0f));
  EXPECT_FLOAT_EQ(b[1].frame, 2.0f);
  EXPECT_EQ(std::get<glm::vec2>(*b[1].inTangent), glm::vec2(1.0f));
}

TEST(AnimationGroup, NormalizeEmptyGroup)
{
  AnimationGroup group("empty");
  group.normalize();
  EXPECT_TRUE(group.isNormalized());
  EXPECT_FLOAT_EQ(group.from(), 0.0f);
  EXPECT_FLOAT_EQ(group.to(), 0.0f);
}

TEST(AnimationGroup, NextTrackIdCounts)
{
  AnimationGroup group;
  EXPECT_EQ(group.nextTrackId(), 0u);
  EXPECT_EQ(group.nextTrackId(), 1u);

  AnimationGroup moved(std::move(group));
  EXPECT_EQ(moved.nextTrackId(), 2u);
}
