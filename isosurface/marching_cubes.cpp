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

#include <array>
#include "mesh_builder.h"
#include "marching_cubes_tables.h"


using namespace glm;


// Cells are formed between neighboring voxel centers, and include the ring of cells that
// straddle the grid boundary.  Samples past the boundary read as the outside value, so the
// surface closes even where the shape touches the edge of the grid.
void Meshing::MarchingCubes(const VoxelGrid& Grid, float IsoLevel, bool SmoothShading, Mesh& OutMesh)
{
	MeshWriter Writer(OutMesh, SmoothShading);

	std::array<float, 8> Values;
	std::array<vec3, 8> Corners;
	std::array<vec3, 12> EdgeVerts;

	for (int Z = -1; Z < Grid.GetDepth(); ++Z)
	{
		for (int Y = -1; Y < Grid.GetHeight(); ++Y)
		{
			for (int X = -1; X < Grid.GetWidth(); ++X)
			{
				int CubeIndex = 0;
				for (int Corner = 0; Corner < 8; ++Corner)
				{
					const ivec3 Coord = ivec3(X + MCCorners[Corner][0], Y + MCCorners[Corner][1], Z + MCCorners[Corner][2]);
					Values[Corner] = Grid.GetVoxel(Coord);
					if (Values[Corner] < IsoLevel)
					{
						CubeIndex |= 1 << Corner;
					}
				}

				const int CrossedEdges = MCEdgeTable[CubeIndex];
				if (CrossedEdges == 0)
				{
					continue;
				}

				for (int Corner = 0; Corner < 8; ++Corner)
				{
					Corners[Corner] = Grid.GetVoxelCenterPos(X + MCCorners[Corner][0], Y + MCCorners[Corner][1], Z + MCCorners[Corner][2]);
				}

				for (int Edge = 0; Edge < 12; ++Edge)
				{
					if (CrossedEdges & (1 << Edge))
					{
						const int Start = MCEdgeCorners[Edge][0];
						const int End = MCEdgeCorners[Edge][1];
						EdgeVerts[Edge] = EdgeIntersection(IsoLevel, Corners[Start], Corners[End], Values[Start], Values[End]);
					}
				}

				const int* Tri = MCTriTable[CubeIndex];
				for (int Index = 0; Tri[Index] != -1; Index += 3)
				{
					Writer.Triangle(EdgeVerts[Tri[Index]], EdgeVerts[Tri[Index + 1]], EdgeVerts[Tri[Index + 2]]);
				}
			}
		}
	}
}
