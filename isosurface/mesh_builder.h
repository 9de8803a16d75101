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
#include "voxel_grid.h"
#include "mesh.h"
#include <cstdint>
#include <string>
#include <map>


enum class MesherKind : int
{
	Blocky = 0,
	MarchingCubes,
	SurfaceNets,

	// -----------
	Count,
	Invalid = Count
};


const char* MesherKindName(MesherKind Kind);
MesherKind ParseMesherKind(const std::string& Name);


// Clears OutMesh and fills it with the surface of the grid at IsoLevel.  Values below IsoLevel
// are inside.  The output only depends on the grid contents, the iso level and the flag.
// Returns FAIL and leaves OutMesh untouched when Kind does not name a mesher.
StatusCode BuildMesh(MesherKind Kind, const VoxelGrid& Grid, float IsoLevel, bool SmoothShading, Mesh& OutMesh);


namespace Meshing
{
	void Blocky(const VoxelGrid& Grid, float IsoLevel, bool SmoothShading, Mesh& OutMesh);

	void MarchingCubes(const VoxelGrid& Grid, float IsoLevel, bool SmoothShading, Mesh& OutMesh);

	void SurfaceNets(const VoxelGrid& Grid, float IsoLevel, bool SmoothShading, Mesh& OutMesh);
}


// Appends triangles to a mesh, reusing any existing vertex at a bit-identical position.
// Callers must derive shared positions with the same arithmetic every time for them to merge.
struct MeshWriter
{
	struct LessVec3
	{
		bool operator()(const glm::vec3& L, const glm::vec3& R) const;
	};

	Mesh& Target;
	uint8_t SmoothGroup;
	std::map<glm::vec3, uint32_t, LessVec3> Memo;

	// Clears the target mesh.
	MeshWriter(Mesh& InTarget, bool SmoothShading);

	uint32_t Vertex(glm::vec3 Position);

	void Triangle(glm::vec3 P0, glm::vec3 P1, glm::vec3 P2);

	// Split into (P0, P1, P2) and (P0, P2, P3).
	void Quad(glm::vec3 P0, glm::vec3 P1, glm::vec3 P2, glm::vec3 P3);
};


// Point where the field crosses IsoLevel between two samples, by linear interpolation.
glm::vec3 EdgeIntersection(float IsoLevel, glm::vec3 Start, glm::vec3 End, float StartDist, float EndDist);
