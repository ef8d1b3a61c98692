#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "Types.hpp"

namespace autocrate {

enum class PlaylistNodeKind {
    Folder,
    Playlist
};

/**
 * Index of a node inside a PlaylistTree.
 */
using NodeIndex = std::size_t;

/**
 * One folder or playlist. Parent and children are indices into the owning
 * tree, never pointers.
 */
struct PlaylistNode {
    std::string name;
    PlaylistNodeKind kind{PlaylistNodeKind::Folder};
    std::optional<NodeIndex> parent;
    std::vector<NodeIndex> children;
    std::vector<TrackId> tracks;

    bool isFolder() const { return kind == PlaylistNodeKind::Folder; }
};

/**
 * Folder/playlist tree stored as an arena of nodes. Node 0 is the root
 * folder. Nodes are never removed, so indices stay valid for the life of
 * the tree.
 */
class PlaylistTree {
public:
    static constexpr NodeIndex ROOT = 0;
    static constexpr const char* DEFAULT_ROOT_NAME = "ROOT";

    explicit PlaylistTree(std::string rootName = DEFAULT_ROOT_NAME);

    NodeIndex getRoot() const { return ROOT; }

    /**
     * Append a folder as the last child of parent.
     * @throws std::invalid_argument if parent is a playlist
     */
    NodeIndex addFolder(NodeIndex parent, std::string name);

    /**
     * Append an empty playlist as the last child of parent.
     * @throws std::invalid_argument if parent is a playlist
     */
    NodeIndex addPlaylist(NodeIndex parent, std::string name);

    /**
     * Append a track reference to a playlist. No deduplication happens here.
     * @throws std::invalid_argument if the node is a folder
     */
    void appendTrack(NodeIndex playlist, TrackId trackId);

    /**
     * Make a node the first child of its parent, keeping the order of the
     * other children.
     * @throws std::invalid_argument for the root
     */
    void moveToFront(NodeIndex index);

    /**
     * @throws std::out_of_range for an unknown index
     */
    const PlaylistNode& getNode(NodeIndex index) const;

    std::size_t size() const { return nodes_.size(); }

    /**
     * First node (depth-first, declared order) under and including start
     * whose name matches exactly.
     */
    std::optional<NodeIndex> findByName(std::string_view name, NodeIndex start = ROOT) const;

    /**
     * Direct child of folder with the given name.
     */
    std::optional<NodeIndex> childNamed(NodeIndex folder, std::string_view name) const;

    /**
     * Every playlist (non-folder) under start, depth-first in declared order.
     */
    std::vector<NodeIndex> leaves(NodeIndex start = ROOT) const;

    /**
     * Track identifiers held directly by a node; empty for folders.
     */
    const std::vector<TrackId>& trackIds(NodeIndex index) const { return getNode(index).tracks; }

    /**
     * Names from the root down to the node joined with " / ".
     */
    std::string path(NodeIndex index) const;

    /**
     * JSON document of the subtree rooted at start: folders carry
     * "playlists", playlists carry "tracks".
     */
    nlohmann::ordered_json toJsonValue(NodeIndex start = ROOT) const;

    /**
     * Compact JSON rendering of the subtree rooted at start.
     */
    std::string toJson(NodeIndex start = ROOT) const;

    /**
     * Indented, human readable listing of the whole tree.
     */
    std::string toString() const;

private:
    NodeIndex addNode(NodeIndex parent, std::string name, PlaylistNodeKind kind);
    void appendListing(NodeIndex index, int depth, std::string& out) const;

    std::vector<PlaylistNode> nodes_;
};

} // namespace autocrate
