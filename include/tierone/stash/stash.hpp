/*
 * Copyright 2025 TierOne Software
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
 */

#pragma once

#include <tierone/stash/error.hpp>
#include <tierone/stash/config.hpp>
#include <tierone/stash/exclusion.hpp>
#include <tierone/stash/enumerator.hpp>
#include <tierone/stash/chunk_boundary.hpp>
#include <tierone/stash/chunk_writer.hpp>
#include <tierone/stash/chunk_reader.hpp>
#include <tierone/stash/index_store.hpp>
#include <tierone/stash/remote_tier.hpp>
#include <tierone/stash/failure_tracker.hpp>
#include <tierone/stash/archive_builder.hpp>
#include <tierone/stash/session.hpp>
#include <tierone/stash/verifier.hpp>
