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

#pragma once

#include <functional>


// Runs the thunk on up to one thread per job and blocks until all of them return.  Thunks are
// expected to pull their jobs from a shared atomic counter until it runs dry, so a thread that
// finds no job left simply returns.  A single job runs on the calling thread.
void Pool(const std::function<void()>& Thunk, int JobCount);

// Number of threads Pool will use for JobCount jobs: at least one, and no more than the
// hardware concurrency (or two, when that is unknown or lower).
int PoolSize(int JobCount);
