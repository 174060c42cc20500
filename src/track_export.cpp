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

#include <fstream>
#include <type_traits>

#include <nvutils/file_operations.hpp>
#include <nvutils/logger.hpp>

#include "track_export.hpp"

namespace propanim {

nlohmann::json toJson(const AnimationValue& value)
{
  return std::visit(
      [](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr(std::is_same_v<T, float>)
          return v;
        else if constexpr(std::is_same_v<T, glm::vec2>)
          return nlohmann::json::array({v.x, v.y});
        else if constexpr(std::is_same_v<T, glm::vec3>)
          return nlohmann::json::array({v.x, v.y, v.z});
        else
          return nlohmann::json::array({v.x, v.y, v.z, v.w});
      },
      value);
}

nlohmann::json toJson(const KeyframeTrack& track)
{
  nlohmann::json keys = nlohmann::json::array();
  for(const Keyframe& key : track.keys)
  {
    nlohmann::json k = {{"frame", key.frame}, {"value", toJson(key.value)}};
    if(key.inTangent)
      k["inTangent"] = toJson(*key.inTangent);
    if(key.outTangent)
      k["outTangent"] = toJson(*key.outTangent);
    keys.push_back(std::move(k));
  }

  return {
      {"name", track.name},
      {"targetPath", track.targetPath},
      {"valueType", std::string(toString(track.valueType))},
      {"interpolation", std::string(toString(track.interpolation))},
      {"keys", std::move(keys)},
  };
}

nlohmann::json toJson(const AnimationGroup& group)
{
  nlohmann::json tracks = nlohmann::json::array();
  for(const TargetedAnimation& animation : group.targetedAnimations())
  {
    nlohmann::json track = toJson(animation.track);
    track["target"]      = {
        {"type", std::string(toString(animation.target.type))},
        {"index", animation.target.index},
        {"node", animation.target.node},
    };
    tracks.push_back(std::move(track));
  }
  return {{"name", group.name()}, {"from", group.from()}, {"to", group.to()}, {"tracks", std::move(tracks)}};
}

bool exportGroups(const std::vector<AnimationGroup>& groups, const std::filesystem::path& filename)
{
  try
  {
    nlohmann::json animations = nlohmann::json::array();
    for(const AnimationGroup& group : groups)
    {
      animations.push_back(toJson(group));
    }

    std::ofstream file(filename);
    if(!file)
    {
      LOGW("Could not open %s for writing\n", nvutils::utf8FromPath(filename).c_str());
      return false;
    }
    file << nlohmann::json{{"animations", std::move(animations)}}.dump(2);
    return file.good();
  }
  catch(const nlohmann::json::exception& e)
  {
    LOGW("Failed to export animations to '%s': %s\n", nvutils::utf8FromPath(filename).c_str(), e.what());
    return false;
  }
}

}  // namespace propanim
