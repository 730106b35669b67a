#pragma once

// Main public API header for vecindex-cpp

// Core concepts
#include "concepts/distance_metric.hpp"
#include "concepts/vector_element.hpp"

// Utilities
#include "utils/error.hpp"
#include "utils/logging.hpp"

// Documents
#include "document.hpp"

// Distance metrics
#include "distances/cosine.hpp"
#include "distances/l2.hpp"

// HNSW index
#include "index/hnsw.hpp"
#include "index/hnsw_node.hpp"
#include "index/hnsw_persistence.hpp"
#include "index/level_generator.hpp"

// Storage service
#include "store/vector_store.hpp"

namespace vecindex_cpp {

// Version information
constexpr const char* VERSION = "0.1.0";
constexpr const char* SOURCE = "vecindex-cpp";

// Version components
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace vecindex_cpp
