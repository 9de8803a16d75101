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


namespace Meshing
{
	// Corner offsets of a marching cubes cell, in the order the tables index them.
	extern const int MCCorners[8][3];

	// The two corners joined by each of the twelve cell edges.  The corner nearer the minimum
	// of the cell is always listed first, so a shared edge is interpolated identically by
	// every cell touching it.
	extern const int MCEdgeCorners[12][2];

	// Bit i is set when edge i is crossed by the surface for a given corner configuration.
	extern const int MCEdgeTable[256];

	// Up to five triangles per configuration as edge indices, terminated by -1.
	extern const int MCTriTable[256][16];
}
