/*
 * Copyright (c) 2024-2026, NVIDIA CORPORATION.  All rights reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 * SPDX-FileCopyrightText: Copyright (c) 2024-2026, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <nvutils/file_operations.hpp>
#include <nvutils/logger.hpp>
#include <nvutils/timers.hpp>

#include "gltf_model_loader.hpp"
#include "property_animation_types.hpp"
#include "tinygltf_utils.hpp"

namespace propanim {

namespace {
// Image bytes are kept as stored, animations never sample them
bool keepImageBytes(tinygltf::Image* image, const int, std::string*, std::string*, int, int, const unsigned char* bytes, int size, void*)
{
  if(bytes != nullptr && size > 0)
    image->image.assign(bytes, bytes + size);
  return true;
}

// Fails on a required extension this tool can't handle, warns about optional ones
bool checkExtensions(const tinygltf::Model& model, const std::string& filename)
{
  for(const std::string& extension : model.extensionsRequired)
  {
    if(!supportedExtensions().contains(extension))
    {
      LOGE("%s: requires unsupported extension %s\n", filename.c_str(), extension.c_str());
      return false;
    }
  }
  for(const std::string& extension : model.extensionsUsed)
  {
    if(!supportedExtensions().contains(extension))
      LOGW("%s: ignoring extension %s\n", filename.c_str(), extension.c_str());
  }
  return true;
}
}  // namespace

const std::unordered_set<std::string>& supportedExtensions()
{
  static const std::unordered_set<std::string> extensions = {
      EXT_PROPERTY_ANIMATION_EXTENSION_NAME,
      KHR_LIGHTS_PUNCTUAL_EXTENSION_NAME,
      KHR_TEXTURE_TRANSFORM_EXTENSION_NAME,
  };
  return extensions;
}

bool loadGltfModel(const std::filesystem::path& filename, tinygltf::Model& model)
{
  nvutils::ScopedTimer st("Read glTF\n");
  const std::string    filenameUtf8 = nvutils::utf8FromPath(filename);
  const std::string    extension    = nvutils::utf8FromPath(filename.extension());

  model = {};
  if(extension != ".gltf" && extension != ".glb")
  {
    LOGE("%s: not a .gltf or .glb file\n", filenameUtf8.c_str());
    return false;
  }

  tinygltf::TinyGLTF gltf;
  gltf.SetImageLoader(keepImageBytes, nullptr);

  std::string warn;
  std::string error;
  const bool  parsed = extension == ".glb" ? gltf.LoadBinaryFromFile(&model, &error, &warn, filenameUtf8) :
                                             gltf.LoadASCIIFromFile(&model, &error, &warn, filenameUtf8);
  if(!warn.empty())
    LOGW("%s: %s\n", filenameUtf8.c_str(), warn.c_str());
  if(!parsed)
  {
    LOGE("%s: %s\n", filenameUtf8.c_str(), error.c_str());
    model = {};
    return false;
  }

  if(!checkExtensions(model, filenameUtf8))
  {
    model = {};
    return false;
  }
  return true;
}

}  // namespace propanim
