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

#include "mesh_builder.h"


using namespace glm;


// Emits one quad for every face between an inside voxel and a neighbor that is outside or
// exactly on the iso level.  The result is the voxel grid's surface, faithful to its
// stair-stepped shape.
void Meshing::Blocky(const VoxelGrid& Grid, float IsoLevel, bool SmoothShading, Mesh& OutMesh)
{
	MeshWriter Writer(OutMesh, SmoothShading);

	for (int Z = 0; Z < Grid.GetDepth(); ++Z)
	{
		for (int Y = 0; Y < Grid.GetHeight(); ++Y)
		{
			for (int X = 0; X < Grid.GetWidth(); ++X)
			{
				if (Grid.GetVoxel(X, Y, Z) > IsoLevel)
				{
					continue;
				}

				// Both corners are computed the same way so that neighboring voxels produce
				// bit-identical positions.  Min + VoxelSize would drift.
				const vec3 Min = Grid.GetVoxelCornerPos(X, Y, Z);
				const vec3 Max = Grid.GetVoxelCornerPos(X + 1, Y + 1, Z + 1);

				const vec3 P0 = vec3(Min.x, Min.y, Min.z);
				const vec3 P1 = vec3(Max.x, Min.y, Min.z);
				const vec3 P2 = vec3(Min.x, Max.y, Min.z);
				const vec3 P3 = vec3(Max.x, Max.y, Min.z);
				const vec3 P4 = vec3(Min.x, Min.y, Max.z);
				const vec3 P5 = vec3(Max.x, Min.y, Max.z);
				const vec3 P6 = vec3(Min.x, Max.y, Max.z);
				const vec3 P7 = vec3(Max.x, Max.y, Max.z);

				// Faces wind counter-clockwise when viewed from outside.
				if (Grid.GetVoxel(X + 1, Y, Z) >= IsoLevel)
				{
					Writer.Quad(P5, P1, P3, P7); // +X
				}
				if (Grid.GetVoxel(X - 1, Y, Z) >= IsoLevel)
				{
					Writer.Quad(P4, P6, P2, P0); // -X
				}
				if (Grid.GetVoxel(X, Y + 1, Z) >= IsoLevel)
				{
					Writer.Quad(P2, P6, P7, P3); // +Y
				}
				if (Grid.GetVoxel(X, Y - 1, Z) >= IsoLevel)
				{
					Writer.Quad(P0, P1, P5, P4); // -Y
				}
				if (Grid.GetVoxel(X, Y, Z + 1) >= IsoLevel)
				{
					Writer.Quad(P5, P7, P6, P4); // +Z
				}
				if (Grid.GetVoxel(X, Y, Z - 1) >= IsoLevel)
				{
					Writer.Quad(P0, P2, P3, P1); // -Z
				}
			}
		}
	}
}
