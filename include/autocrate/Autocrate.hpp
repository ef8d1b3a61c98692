#pragma once

/**
 * Autocrate - tag driven DJ playlist generation
 *
 * Builds a playlist tree for a DJ collection from genre and "My Tag"
 * annotations, organized by a declarative taxonomy, plus "Combiner"
 * playlists defined as boolean expressions over tags, playlists, BPMs and
 * ratings.
 */

// Core utilities
#include "Types.hpp"
#include "Util.hpp"
#include "Errors.hpp"

// Collection model
#include "Track.hpp"
#include "PlaylistTree.hpp"
#include "Collection.hpp"

// Configuration
#include "Taxonomy.hpp"
#include "LeafFilter.hpp"
#include "BuilderSettings.hpp"

// Tagging and tree building
#include "TagParser.hpp"
#include "TaxonomyTreeBuilder.hpp"

// Combiner
#include "combiner/Selector.hpp"
#include "combiner/BooleanNode.hpp"
#include "combiner/SelectorPrescanner.hpp"
#include "combiner/Combiner.hpp"

// Orchestration and reporting
#include "PlaylistBuilder.hpp"
#include "TagStatistics.hpp"

// Version is defined in Types.hpp
