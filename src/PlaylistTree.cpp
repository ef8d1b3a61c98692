#include "autocrate/PlaylistTree.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

namespace autocrate {

PlaylistTree::PlaylistTree(std::string rootName) {
    PlaylistNode root;
    root.name = std::move(rootName);
    root.kind = PlaylistNodeKind::Folder;
    nodes_.push_back(std::move(root));
}

NodeIndex PlaylistTree::addNode(NodeIndex parent, std::string name, PlaylistNodeKind kind) {
    if (!getNode(parent).isFolder()) {
        throw std::invalid_argument(
            fmt::format("Cannot add \"{}\" under playlist \"{}\"", name, nodes_[parent].name));
    }
    const NodeIndex index = nodes_.size();
    PlaylistNode node;
    node.name = std::move(name);
    node.kind = kind;
    node.parent = parent;
    nodes_.push_back(std::move(node));
    nodes_[parent].children.push_back(index);
    return index;
}

NodeIndex PlaylistTree::addFolder(NodeIndex parent, std::string name) {
    return addNode(parent, std::move(name), PlaylistNodeKind::Folder);
}

NodeIndex PlaylistTree::addPlaylist(NodeIndex parent, std::string name) {
    return addNode(parent, std::move(name), PlaylistNodeKind::Playlist);
}

void PlaylistTree::appendTrack(NodeIndex playlist, TrackId trackId) {
    if (getNode(playlist).isFolder()) {
        throw std::invalid_argument(
            fmt::format("Cannot add track {} to folder \"{}\"", trackId, nodes_[playlist].name));
    }
    nodes_[playlist].tracks.push_back(std::move(trackId));
}

void PlaylistTree::moveToFront(NodeIndex index) {
    const auto& parent = getNode(index).parent;
    if (!parent) {
        throw std::invalid_argument("The root folder has no siblings");
    }
    auto& siblings = nodes_[*parent].children;
    auto it = std::find(siblings.begin(), siblings.end(), index);
    std::rotate(siblings.begin(), it, it + 1);
}

const PlaylistNode& PlaylistTree::getNode(NodeIndex index) const {
    if (index >= nodes_.size()) {
        throw std::out_of_range(fmt::format("No playlist node at index {}", index));
    }
    return nodes_[index];
}

std::optional<NodeIndex> PlaylistTree::findByName(std::string_view name, NodeIndex start) const {
    const auto& node = getNode(start);
    if (node.name == name) {
        return start;
    }
    for (const NodeIndex child : node.children) {
        if (auto found = findByName(name, child)) {
            return found;
        }
    }
    return std::nullopt;
}

std::optional<NodeIndex> PlaylistTree::childNamed(NodeIndex folder, std::string_view name) const {
    for (const NodeIndex child : getNode(folder).children) {
        if (nodes_[child].name == name) {
            return child;
        }
    }
    return std::nullopt;
}

std::vector<NodeIndex> PlaylistTree::leaves(NodeIndex start) const {
    std::vector<NodeIndex> result;
    std::vector<NodeIndex> stack{start};
    while (!stack.empty()) {
        const NodeIndex index = stack.back();
        stack.pop_back();
        const auto& node = getNode(index);
        if (!node.isFolder()) {
            result.push_back(index);
            continue;
        }
        for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
            stack.push_back(*it);
        }
    }
    return result;
}

std::string PlaylistTree::path(NodeIndex index) const {
    std::string result = getNode(index).name;
    auto parent = nodes_[index].parent;
    while (parent) {
        result = nodes_[*parent].name + " / " + result;
        parent = nodes_[*parent].parent;
    }
    return result;
}

nlohmann::ordered_json PlaylistTree::toJsonValue(NodeIndex start) const {
    const auto& node = getNode(start);
    nlohmann::ordered_json value;
    value["name"] = node.name;
    value["type"] = node.isFolder() ? "folder" : "playlist";
    if (node.isFolder()) {
        value["playlists"] = nlohmann::ordered_json::array();
        for (const NodeIndex child : node.children) {
            value["playlists"].push_back(toJsonValue(child));
        }
    } else {
        value["tracks"] = node.tracks;
    }
    return value;
}

std::string PlaylistTree::toJson(NodeIndex start) const {
    // Names come from user documents; replace invalid UTF-8 rather than throw
    return toJsonValue(start).dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

void PlaylistTree::appendListing(NodeIndex index, int depth, std::string& out) const {
    const auto& node = nodes_[index];
    const std::string indent(static_cast<size_t>(depth) * 2, ' ');
    if (node.isFolder()) {
        out += fmt::format("{}+ {}\n", indent, node.name);
        for (const NodeIndex child : node.children) {
            appendListing(child, depth + 1, out);
        }
    } else {
        out += fmt::format("{}- {} ({} tracks)\n", indent, node.name, node.tracks.size());
    }
}

std::string PlaylistTree::toString() const {
    std::string out;
    appendListing(ROOT, 0, out);
    return out;
}

} // namespace autocrate
