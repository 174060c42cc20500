#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include <tinygltf/tiny_gltf.h>

namespace propanim_test {

// Test resource management
class TestResources
{
public:
  static std::filesystem::path getTempPath(const std::string& filename);
  static void                  cleanupTempFiles();
};

struct SamplerDesc
{
  int         input  = -1;
  int         output = -1;
  std::string interpolation;  // Empty: omitted, which means LINEAR
};

struct ChannelDesc
{
  int         sampler = 0;
  std::string target;
};

// Builds small glTF models in memory. All accessors share one float buffer.
class ModelBuilder
{
public:
  ModelBuilder();

  // Returns the accessor index; `type` is TINYGLTF_TYPE_SCALAR, TINYGLTF_TYPE_VEC2, ...
  int addFloatAccessor(const std::vector<float>& values, int type = TINYGLTF_TYPE_SCALAR);
  int addMaterial(const std::string& name = {});
  // The light is instanced by a new node when `instanced` is true
  int addLight(const std::string& name = {}, bool instanced = true);
  int addAnimation(const std::string& name, const std::vector<SamplerDesc>& samplers, const std::vector<ChannelDesc>& channels);

  tinygltf::Model& model() { return m_model; }

private:
  tinygltf::Model m_model;
};

}  // namespace propanim_test
