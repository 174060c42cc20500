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

#pragma once

#include <atomic>
#include <limits>
#include <mutex>
#include <string>
#include <vector>

#include "property_animation_types.hpp"

namespace propanim {

struct TargetedAnimation
{
  KeyframeTrack track;
  TargetObject  target;
};

/*-------------------------------------------------------------------------------------------------
# class `propanim::AnimationGroup`
> The tracks of one glTF animation, each bound to a scene object.

Channels of one animation may be assembled concurrently: `nextTrackId()` and
`addTargetedAnimation()` are thread safe. `normalize()` must be called once, after all
channels are attached.
-------------------------------------------------------------------------------------------------*/
class AnimationGroup
{
public:
  explicit AnimationGroup(std::string name = {});

  AnimationGroup(AnimationGroup&& other) noexcept;
  AnimationGroup& operator=(AnimationGroup&& other) noexcept;

  const std::string& name() const { return m_name; }

  // Running counter used to make track names unique within the group
  uint32_t nextTrackId() { return m_nextTrackId.fetch_add(1); }

  void                                  addTargetedAnimation(KeyframeTrack track, const TargetObject& target);
  const std::vector<TargetedAnimation>& targetedAnimations() const { return m_animations; }

  // Pads every track with copies of its first and last keys so all tracks span [from, to]
  void normalize();

  float from() const { return m_from; }
  float to() const { return m_to; }
  bool  isNormalized() const { return m_normalized; }

private:
  std::string                    m_name;
  std::vector<TargetedAnimation> m_animations;
  std::mutex                     m_mutex;
  std::atomic<uint32_t>          m_nextTrackId{0};

  float m_from       = 0.0f;
  float m_to         = 0.0f;
  bool  m_normalized = false;
};

}  // namespace propanim
