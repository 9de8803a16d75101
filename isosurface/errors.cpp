// Copyright 2022 Aeva Palecek
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

#include "errors.h"

#if _DEBUG
#include <cstdlib>
#include <fmt/format.h>
#endif


const char* StatusName(StatusCode Status)
{
	switch (Status)
	{
	case StatusCode::PASS:
		return "PASS";

	case StatusCode::FAIL:
		return "FAIL";

	case StatusCode::INVALID_SHAPE_CONFIGURATION:
		return "INVALID_SHAPE_CONFIGURATION";

	case StatusCode::INVALID_GRID_CONFIGURATION:
		return "INVALID_GRID_CONFIGURATION";
	}
	UNREACHABLE();
}


#if _DEBUG
void Assert(bool Condition)
{
	if (!Condition)
	{
		fmt::print("ASSERTION FAILURE\n");
		BreakPoint();
		std::abort();
	}
}
#endif
