// Copyright 2023 Aeva Palecek
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include "glm_common.h"
#include <cstdint>
#include <functional>
#include <array>
#include <vector>


struct Mesh
{
	using TriangleT = std::array<glm::vec3, 3>;
	using TriangleThunk = std::function<void(const TriangleT&)>;

	std::vector<glm::vec3> Positions;

	// Three indices into Positions per triangle.
	std::vector<glm::uvec3> Triangles;

	// One entry per triangle.  0 is flat, 1 is smooth.
	std::vector<uint8_t> SmoothingGroups;

	// Renderers that require a texture coordinate slot may point every corner at this.
	static glm::vec2 DefaultTexCoord()
	{
		return glm::vec2(0.0f, 0.0f);
	}

	void Clear();

	size_t VertexCount() const { return Positions.size(); }
	size_t TriangleCount() const { return Triangles.size(); }

	// Rewrites the smoothing group of every triangle without touching the geometry.
	void SetSmoothShading(bool SmoothShading);

	void WalkTriangles(TriangleThunk Thunk) const;

	// Sum of signed tetrahedron volumes against the origin.  Positive for a closed mesh with
	// outward facing triangles.
	double SignedVolume() const;
};
