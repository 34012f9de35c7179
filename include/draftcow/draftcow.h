// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file draftcow.h
/// @brief Convenience header including the whole public API.

#pragma once

#include <draftcow/draftcow_config.h>

#include <draftcow/clone_provider.h>
#include <draftcow/draft_scope.h>
#include <draftcow/draft_state.h>
#include <draftcow/exceptions.h>
#include <draftcow/heap.h>
#include <draftcow/json_pointer.h>
#include <draftcow/lcs.h>
#include <draftcow/object_proxy.h>
#include <draftcow/patch.h>
#include <draftcow/patch_generator.h>
#include <draftcow/path_segment.h>
#include <draftcow/produce.h>
#include <draftcow/producer_options.h>
#include <draftcow/proxy_dictionary.h>
#include <draftcow/proxy_list.h>
#include <draftcow/serialization.h>
#include <draftcow/store.h>
#include <draftcow/type_registry.h>
#include <draftcow/value.h>
