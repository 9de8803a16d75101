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

#include <vector>
#include <cstddef>
#include "glm_common.h"
#include "errors.h"
#include "sdfs.h"


// Dense scalar field sampled at voxel centers.  Voxels are stored in row-major order, with X
// varying fastest, then Y, then Z.
class VoxelGrid
{
public:
	static constexpr float DefaultVoxelSize = 0.1f;

	// Returned for any coordinate outside the grid, so meshers can read one cell past the
	// edge without branching on bounds.
	static constexpr float OutsideValue = 10000.0f;

	VoxelGrid();

	float GetVoxelSize() const { return VoxelSize; }

	static bool ValidVoxelSize(float VoxelSize);

	// Rejects sizes that are not positive and finite with INVALID_GRID_CONFIGURATION.
	StatusCode SetVoxelSize(float NewVoxelSize);

	int GetWidth() const { return Dimensions.x; }
	int GetHeight() const { return Dimensions.y; }
	int GetDepth() const { return Dimensions.z; }
	glm::ivec3 GetDimensions() const { return Dimensions; }

	// World space position of the minimum corner of voxel (0, 0, 0).
	glm::vec3 GetOrigin() const { return Origin; }

	size_t VoxelCount() const;

	// Number of voxels the backing storage can hold without reallocating.
	size_t Capacity() const { return Voxels.size(); }

	// Moves and resizes the grid so that it encloses the shape's world bounds with at least
	// one voxel of padding on every side.  Voxel values are left stale until Voxelize.
	void FitToShape(const Shape& Target);

	// Samples the shape's world space distance at the center of every voxel.
	void Voxelize(const Shape& Target);

	bool InBounds(int X, int Y, int Z) const;

	float GetVoxel(int X, int Y, int Z) const;
	float GetVoxel(glm::ivec3 Coord) const;

	// These accept coordinates outside of the grid.
	glm::vec3 GetVoxelCornerPos(int X, int Y, int Z) const;
	glm::vec3 GetVoxelCornerPos(glm::ivec3 Coord) const;
	glm::vec3 GetVoxelCenterPos(int X, int Y, int Z) const;
	glm::vec3 GetVoxelCenterPos(glm::ivec3 Coord) const;

private:
	size_t Index(int X, int Y, int Z) const;

	float VoxelSize;
	glm::vec3 Origin;
	glm::ivec3 Dimensions;
	std::vector<float> Voxels;
};


// Rounds up to the next power of two.  Zero rounds up to one.
size_t NextPowerOfTwo(size_t Value);
