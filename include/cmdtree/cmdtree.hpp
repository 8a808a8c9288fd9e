#pragma once

/**
 * @file cmdtree.hpp
 * @brief Umbrella header for the command-tree loader.
 *
 * @example
 * ```cpp
 * #include <cmdtree/cmdtree.hpp>
 *
 * cmdtree::ModuleCatalog catalog;
 * catalog.add("gcloud", [](const cmdtree::ModuleRequest&) {
 *     return std::vector<cmdtree::ArtifactPtr>{cmdtree::make_group("gcloud")};
 * });
 *
 * cmdtree::PassthroughTranslator translator;
 * cmdtree::LoadSession session(cmdtree::make_construction_id(), catalog, &translator);
 *
 * cmdtree::TreeLoadOptions options;
 * options.root_name = "gcloud";
 * options.release_track = cmdtree::ReleaseTrack::BETA;
 * auto result = cmdtree::load_command_tree("/path/to/surface", options, session);
 * ```
 */

#include "cmdtree/artifact.hpp"
#include "cmdtree/config.hpp"
#include "cmdtree/discovery.hpp"
#include "cmdtree/errors.hpp"
#include "cmdtree/loader.hpp"
#include "cmdtree/module_catalog.hpp"
#include "cmdtree/release_track.hpp"
#include "cmdtree/resolver.hpp"
#include "cmdtree/spec_loader.hpp"
#include "cmdtree/translator.hpp"
#include "cmdtree/tree.hpp"
#include "cmdtree/types.hpp"

#define CMDTREE_VERSION_MAJOR 1
#define CMDTREE_VERSION_MINOR 0
#define CMDTREE_VERSION_PATCH 0
