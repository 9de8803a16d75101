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

#include <cstddef>
#include "glm_common.h"
#include "errors.h"
#include "sdfs.h"
#include "voxel_grid.h"
#include "mesh.h"
#include "mesh_builder.h"


struct IsosurfaceSettings
{
	ShapeParams Params = SphereParams();
	glm::dvec3 Translation = glm::dvec3(0.0);
	glm::dvec3 RotationDegrees = glm::dvec3(0.0);
	glm::dvec3 Scale = glm::dvec3(1.0);
	float VoxelSize = VoxelGrid::DefaultVoxelSize;
	float IsoLevel = 0.0f;
	MesherKind Mesher = MesherKind::MarchingCubes;
	bool SmoothShading = true;

	// Fraction of the voxel size at or below which a triangle edge counts as degenerate.
	float DegenerateThreshold = 0.05f;
};


// Clamps settings into the ranges an interactive front end would allow.  Shape parameters
// are kept non-negative, scale components at or above 0.001, the voxel size within
// [0.025, 0.25] and the degenerate threshold within [0, 1].
IsosurfaceSettings ClampSettings(const IsosurfaceSettings& Settings);


struct IsosurfaceStats
{
	float VoxelSize = 0.0f;
	glm::ivec3 Dimensions = glm::ivec3(0);
	size_t VertexCount = 0;
	size_t TriangleCount = 0;
	size_t DegenerateCount = 0;
	double VoxelizeMillis = 0.0;
	double MeshMillis = 0.0;
};


// Number of triangles whose shortest edge is no longer than VoxelSize * Threshold.
size_t CountDegenerateTriangles(const Mesh& Target, float VoxelSize, float Threshold);


// Owns the shape, the voxel grid and the mesh, and rebuilds as little as each settings
// change requires.
class IsosurfacePipeline
{
public:
	// Applies the shape and transform, refits and revoxelizes the grid, then rebuilds the mesh.
	StatusCode UpdateVoxelGrid(const IsosurfaceSettings& Settings);

	// Rebuilds the mesh from the current grid contents.
	StatusCode UpdateMesh(const IsosurfaceSettings& Settings);

	void SetSmoothShading(bool SmoothShading);

	const IsosurfaceStats& Stats() const { return CurrentStats; }

	const Shape& GetShape() const { return CurrentShape; }
	const VoxelGrid& GetGrid() const { return Grid; }
	const Mesh& GetMesh() const { return Surface; }

private:
	// Applies the shape, transform and voxel size, or changes nothing if any of them is rejected.
	StatusCode ApplySettings(const IsosurfaceSettings& Settings);

	Shape CurrentShape;
	VoxelGrid Grid;
	Mesh Surface;
	IsosurfaceStats CurrentStats;
};
