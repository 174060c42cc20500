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

#include <filesystem>
#include <string>
#include <unordered_set>

#include <tinygltf/tiny_gltf.h>

namespace propanim {

// Extensions this project can handle when they appear in extensionsRequired
const std::unordered_set<std::string>& supportedExtensions();

// Load a .gltf or .glb file. Images are kept as raw bytes and never decoded.
// Fails if the file can't be parsed or requires an unsupported extension.
bool loadGltfModel(const std::filesystem::path& filename, tinygltf::Model& model);

}  // namespace propanim
