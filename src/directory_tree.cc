// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/directory_tree.h"
#include "archive_chunker/chunker_error.h"

#include <utility>

namespace archive_chunker {

DirectoryNode::DirectoryNode(std::string node_path, std::string node_name)
    : path(std::move(node_path))
    , name(std::move(node_name)) {}

// Children are released one level at a time so that destroying a very deep
// tree does not recurse through unique_ptr destructors.
DirectoryNode::~DirectoryNode() {
  std::vector<std::unique_ptr<DirectoryNode>> pending;
  for (auto &child : child_directories) {
    pending.push_back(std::move(child.second));
  }
  child_directories.clear();

  while (!pending.empty()) {
    std::unique_ptr<DirectoryNode> node = std::move(pending.back());
    pending.pop_back();
    for (auto &child : node->child_directories) {
      pending.push_back(std::move(child.second));
    }
    node->child_directories.clear();
  }
}

uint64_t DirectoryNode::direct_size() const {
  uint64_t total = 0;
  for (const auto &file : direct_files) {
    total += file.second->size_bytes;
  }
  return total;
}

std::vector<std::string> split_relative_path(const std::string &path) {
  if (path.empty()) {
    throw MalformedPathError(path, "path is empty");
  }
  if (path.front() == '/') {
    throw MalformedPathError(path, "path is absolute");
  }
  for (char ch : path) {
    const auto byte = static_cast<unsigned char>(ch);
    if (byte < 0x20 || byte == 0x7f) {
      throw MalformedPathError(path, "path contains a control character");
    }
  }

  std::vector<std::string> components;
  std::string::size_type start = 0;
  while (true) {
    const std::string::size_type slash = path.find('/', start);
    std::string component = path.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
    if (component.empty()) {
      throw MalformedPathError(path, "path contains an empty segment");
    }
    if (component == "..") {
      throw MalformedPathError(path, "path escapes the archive root");
    }
    if (component == ".") {
      throw MalformedPathError(path, "path is not normalized");
    }
    components.push_back(std::move(component));
    if (slash == std::string::npos) {
      break;
    }
    start = slash + 1;
  }
  return components;
}

namespace {

void insert_record(DirectoryNode &root, const FileRecord &record) {
  const std::vector<std::string> components = split_relative_path(record.relative_path);

  DirectoryNode *node = &root;
  for (std::size_t i = 0; i + 1 < components.size(); ++i) {
    const std::string &component = components[i];
    if (node->direct_files.count(component) != 0) {
      throw MalformedPathError(record.relative_path, "directory '" + component + "' collides with an existing file name");
    }
    auto it = node->child_directories.find(component);
    if (it == node->child_directories.end()) {
      std::string child_path = node->path.empty() ? component : node->path + "/" + component;
      auto child = std::make_unique<DirectoryNode>(std::move(child_path), component);
      it = node->child_directories.emplace(component, std::move(child)).first;
    }
    node = it->second.get();
  }

  const std::string &file_name = components.back();
  if (node->child_directories.count(file_name) != 0) {
    throw MalformedPathError(record.relative_path, "file name collides with an existing directory name");
  }
  if (!node->direct_files.emplace(file_name, &record).second) {
    throw MalformedPathError(record.relative_path, "path appears more than once in the catalog");
  }
}

// Iterative post-order: a node is summed once all of its children have been.
void compute_subtree_sizes(DirectoryNode &root) {
  struct Frame {
    DirectoryNode *node;
    bool children_done;
  };

  std::vector<Frame> stack;
  stack.push_back({ &root, false });
  while (!stack.empty()) {
    Frame &frame = stack.back();
    DirectoryNode *node = frame.node;
    if (!frame.children_done) {
      frame.children_done = true;
      for (auto &child : node->child_directories) {
        stack.push_back({ child.second.get(), false });
      }
      continue;
    }

    uint64_t total = node->direct_size();
    for (const auto &child : node->child_directories) {
      total += child.second->subtree_size;
    }
    node->subtree_size = total;
    stack.pop_back();
  }
}

} // namespace

std::unique_ptr<DirectoryNode> build_directory_tree(const FileCatalog &catalog) {
  auto root = std::make_unique<DirectoryNode>();
  for (const FileRecord &record : catalog) {
    insert_record(*root, record);
  }
  compute_subtree_sizes(*root);
  return root;
}

std::size_t count_directories(const DirectoryNode &root) {
  std::size_t count = 0;
  std::vector<const DirectoryNode *> stack{ &root };
  while (!stack.empty()) {
    const DirectoryNode *node = stack.back();
    stack.pop_back();
    ++count;
    for (const auto &child : node->child_directories) {
      stack.push_back(child.second.get());
    }
  }
  return count;
}

} // namespace archive_chunker
