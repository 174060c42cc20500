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

#include <algorithm>
#include <type_traits>

#include "animation_group.hpp"

namespace propanim {

namespace {
AnimationValue zeroLike(const AnimationValue& value)
{
  return std::visit(
      [](const auto& v) -> AnimationValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr(std::is_same_v<T, glm::quat>)
          return glm::quat(0.0f, 0.0f, 0.0f, 0.0f);
        else
          return T(0.0f);
      },
      value);
}

// Copy of `key` moved to `frame`; a held key has flat tangents
Keyframe holdKey(const Keyframe& key, float frame)
{
  Keyframe held = key;
  held.frame    = frame;
  if(held.inTangent)
    held.inTangent = zeroLike(*held.inTangent);
  if(held.outTangent)
    held.outTangent = zeroLike(*held.outTangent);
  return held;
}
}  // namespace

AnimationGroup::AnimationGroup(std::string name)
    : m_name(std::move(name))
{
}

AnimationGroup::AnimationGroup(AnimationGroup&& other) noexcept
    : m_name(std::move(other.m_name))
    , m_animations(std::move(other.m_animations))
    , m_nextTrackId(other.m_nextTrackId.load())
    , m_from(other.m_from)
    , m_to(other.m_to)
    , m_normalized(other.m_normalized)
{
}

AnimationGroup& AnimationGroup::operator=(AnimationGroup&& other) noexcept
{
  if(this != &other)
  {
    m_name        = std::move(other.m_name);
    m_animations  = std::move(other.m_animations);
    m_nextTrackId = other.m_nextTrackId.load();
    m_from        = other.m_from;
    m_to          = other.m_to;
    m_normalized  = other.m_normalized;
  }
  return *this;
}

void AnimationGroup::addTargetedAnimation(KeyframeTrack track, const TargetObject& target)
{
  std::lock_guard<std::mutex> lock(m_mutex);
  m_animations.push_back({std::move(track), target});
}

//--------------------------------------------------------------------------------------------------
// Makes all tracks of the group cover the same frame range
//
void AnimationGroup::normalize()
{
  std::lock_guard<std::mutex> lock(m_mutex);

  float from = std::numeric_limits<float>::max();
  float to   = std::numeric_limits<float>::lowest();
  for(const TargetedAnimation& animation : m_animations)
  {
    if(animation.track.keys.empty())
      continue;
    from = std::min(from, animation.track.keys.front().frame);
    to   = std::max(to, animation.track.keys.back().frame);
  }

  m_normalized = true;
  if(from > to)
  {
    return;  // No keys at all
  }
  m_from = from;
  m_to   = to;

  for(TargetedAnimation& animation : m_animations)
  {
    std::vector<Keyframe>& keys = animation.track.keys;
    if(keys.empty())
      continue;

    if(keys.front().frame > from)
    {
      keys.insert(keys.begin(), holdKey(keys.front(), from));
    }
    if(keys.back().frame < to)
    {
      keys.push_back(holdKey(keys.back(), to));
    }
  }
}

}  // namespace propanim
