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

#include <filesystem>
#include <vector>

#include <nvutils/file_operations.hpp>
#include <nvutils/logger.hpp>
#include <nvutils/parameter_parser.hpp>
#include <nvutils/timers.hpp>

#include "gltf_model_loader.hpp"
#include "property_animation_loader.hpp"
#include "track_export.hpp"

//////////////////////////////////////////////////////////////////////////
///
/// Loads the EXT_property_animation animations of a glTF file and prints
/// the decoded tracks, optionally exporting them as JSON.
///
auto main(int argc, char** argv) -> int
{
  nvutils::Logger&           logger   = nvutils::Logger::getInstance();
  nvutils::Logger::LogLevel  logLevel = nvutils::Logger::LogLevel::eINFO;
  nvutils::Logger::ShowFlags logShow  = nvutils::Logger::ShowBits::eSHOW_NONE;

  std::filesystem::path    sceneFilename{};
  std::filesystem::path    exportFilename{};
  propanim::LoaderSettings settings{};

  // Command line parameters registration
  nvutils::ParameterRegistry parameterRegistry;
  parameterRegistry.add({"scenefile", "Input scene filename"}, {".gltf", ".glb"}, &sceneFilename);
  parameterRegistry.add({"export", "Write the decoded tracks to a JSON file"}, {".json"}, &exportFilename);
  parameterRegistry.add({"parallel", "Load channels and samplers on worker threads"}, &settings.asyncLoad, true);
  parameterRegistry.add({"logLevel", "Log level: [Info:0, Warning:1, Error:2]"}, reinterpret_cast<int*>(&logLevel));
  parameterRegistry.add({"logShow", "Show extra log info (bitset): [0:None, 1:Time, 2:Level]"}, reinterpret_cast<int*>(&logShow));

  nvutils::ParameterParser cli(nvutils::getExecutablePath().stem().string());
  cli.add(parameterRegistry);
  cli.parse(argc, argv);

  logger.setMinimumLogLevel(logLevel);
  logger.setShowFlags(logShow);

  if(sceneFilename.empty())
  {
    LOGE("No scene file given, use --scenefile <file.gltf>\n");
    return 1;
  }

  tinygltf::Model model;
  if(!propanim::loadGltfModel(sceneFilename, model))
  {
    return 1;
  }

  std::vector<propanim::AnimationGroup> groups;
  int                                   failures = 0;
  {
    nvutils::ScopedTimer            st("Load property animations\n");
    propanim::PropertyAnimationLoader loader(model, settings);
    failures = loader.loadAll(groups);
  }

  for(const propanim::AnimationGroup& group : groups)
  {
    LOGI("%s [%g, %g]\n", group.name().c_str(), group.from(), group.to());
    for(const propanim::TargetedAnimation& animation : group.targetedAnimations())
    {
      LOGI("  %s -> %s %d .%s (%s, %s, %zu keys)\n", animation.track.name.c_str(),
           std::string(propanim::toString(animation.target.type)).c_str(), animation.target.index,
           animation.track.targetPath.c_str(), std::string(propanim::toString(animation.track.valueType)).c_str(),
           std::string(propanim::toString(animation.track.interpolation)).c_str(), animation.track.keys.size());
    }
  }

  if(!exportFilename.empty() && !propanim::exportGroups(groups, exportFilename))
  {
    LOGE("Failed to export %s\n", nvutils::utf8FromPath(exportFilename).c_str());
    return 1;
  }

  return failures > 0 ? 2 : 0;
}
