// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/web_view.h"
#include "archive_chunker/chunker_error.h"
#include "archive_chunker/directory_tree.h"
#include "archive_chunker/listing_format.h"

#include <memory>
#include <set>
#include <system_error>
#include <utility>
#include <vector>

namespace archive_chunker {

namespace {

struct FolderSlot {
  const DirectoryNode *node;
  std::string id;
  std::size_t parent; ///< Index into the slot vector; npos for the root
  std::set<uint32_t> chunks;
  nlohmann::json children = nlohmann::json::array();
};

nlohmann::json chunk_array(const std::set<uint32_t> &chunks) {
  nlohmann::json array = nlohmann::json::array();
  for (uint32_t chunk : chunks) {
    array.push_back(chunk);
  }
  return array;
}

// Keeps the embedded document from closing the surrounding <script> element.
std::string escape_for_script(const std::string &json) {
  std::string escaped;
  escaped.reserve(json.size());
  for (std::size_t i = 0; i < json.size(); ++i) {
    if (json[i] == '<' && i + 1 < json.size() && json[i + 1] == '/') {
      escaped += "<\\/";
      ++i;
      continue;
    }
    escaped.push_back(json[i]);
  }
  return escaped;
}

const char *kPageHead = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="utf-8">
<title>Archive browser</title>
<style>
body { font-family: sans-serif; margin: 2em; }
table { border-collapse: collapse; width: 100%; }
td, th { padding: 0.25em 0.75em; text-align: left; border-bottom: 1px solid #ddd; }
td.size, th.size { text-align: right; }
a { cursor: pointer; color: #0645ad; }
#chain a { margin-right: 0.25em; }
#selection { margin-top: 1em; font-weight: bold; }
</style>
</head>
<body>
<div id="chain"></div>
<table><thead><tr><th>Name</th><th class="size">Size</th><th>Chunks</th></tr></thead><tbody id="rows"></tbody></table>
<div id="selection"></div>
<script id="file-map" type="application/json">
)HTML";

const char *kPageTail = R"HTML(
</script>
<script>
const data = JSON.parse(document.getElementById('file-map').textContent);
const map = data.fileMap;
function human(n) {
  const units = ['Bytes', 'KB', 'MB', 'GB', 'TB'];
  let i = 0;
  while (n >= 1024 && i < units.length - 1) { n /= 1024; i++; }
  return i === 0 ? n + ' Bytes' : n.toFixed(2) + ' ' + units[i];
}
function show(id) {
  const folder = map[id];
  const chain = [];
  for (let cur = folder; cur; cur = cur.parentId ? map[cur.parentId] : null) { chain.unshift(cur); }
  const chainEl = document.getElementById('chain');
  chainEl.innerHTML = '';
  chain.forEach(node => {
    const link = document.createElement('a');
    link.textContent = node.name + ' /';
    link.onclick = () => show(node.id);
    chainEl.appendChild(link);
  });
  const rows = document.getElementById('rows');
  rows.innerHTML = '';
  folder.childrenIds.map(child => map[child]).forEach(node => {
    const row = document.createElement('tr');
    const name = document.createElement('td');
    const link = document.createElement('a');
    link.textContent = node.name + (node.isDir ? '/' : '');
    link.onclick = () => node.isDir ? show(node.id) : select(node);
    name.appendChild(link);
    const size = document.createElement('td');
    size.className = 'size';
    size.textContent = human(node.size);
    const chunks = document.createElement('td');
    chunks.textContent = node.presentInChunks.join(', ');
    row.append(name, size, chunks);
    rows.appendChild(row);
  });
  select(folder);
}
function select(node) {
  document.getElementById('selection').textContent =
    node.name + ' is stored in chunk(s): ' + (node.presentInChunks.join(', ') || 'none');
}
show(data.rootFolderId);
</script>
</body>
</html>
)HTML";

} // namespace

nlohmann::json build_file_map(const FileCatalog &catalog, const ChunkDictionary &dictionary, const std::string &root_name) {
  const std::unique_ptr<DirectoryNode> root = build_directory_tree(catalog);
  constexpr std::size_t kNoParent = static_cast<std::size_t>(-1);

  nlohmann::json file_map = nlohmann::json::object();
  std::vector<FolderSlot> folders;
  std::size_t next_id = 0;

  // Pre-order over folders; files get their ids when their folder is visited.
  std::vector<std::pair<const DirectoryNode *, std::size_t>> stack;
  stack.push_back({ root.get(), kNoParent });
  while (!stack.empty()) {
    const auto [node, parent] = stack.back();
    stack.pop_back();

    const std::size_t index = folders.size();
    folders.push_back({ node, std::to_string(next_id++), parent, {}, nlohmann::json::array() });
    if (parent != kNoParent) {
      folders[parent].children.push_back(folders[index].id);
    }

    for (const auto &file : node->direct_files) {
      const FileRecord &record = *file.second;
      const std::string file_id = std::to_string(next_id++);
      std::set<uint32_t> chunks;
      const auto it = dictionary.find(record.relative_path);
      if (it != dictionary.end()) {
        chunks.insert(it->second);
        folders[index].chunks.insert(it->second);
      }

      nlohmann::json item;
      item["id"] = file_id;
      item["name"] = file.first;
      item["isDir"] = false;
      item["parentId"] = folders[index].id;
      item["childrenIds"] = nlohmann::json::array();
      item["size"] = record.size_bytes;
      item["modDate"] = format_last_modified(record.last_modified);
      item["presentInChunks"] = chunk_array(chunks);
      file_map[file_id] = std::move(item);
      folders[index].children.push_back(file_id);
    }

    const auto &children = node->child_directories;
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
      stack.push_back({ it->second.get(), index });
    }
  }

  // Reverse pre-order visits every child folder before its parent.
  for (auto it = folders.rbegin(); it != folders.rend(); ++it) {
    if (it->parent != kNoParent) {
      folders[it->parent].chunks.insert(it->chunks.begin(), it->chunks.end());
    }
  }

  for (FolderSlot &folder : folders) {
    nlohmann::json item;
    item["id"] = folder.id;
    item["name"] = folder.parent == kNoParent ? root_name : folder.node->name;
    item["isDir"] = true;
    item["parentId"] = folder.parent == kNoParent ? nlohmann::json(nullptr) : nlohmann::json(folders[folder.parent].id);
    item["childrenIds"] = std::move(folder.children);
    item["size"] = folder.node->subtree_size;
    item["presentInChunks"] = chunk_array(folder.chunks);
    file_map[folder.id] = std::move(item);
  }

  nlohmann::json document;
  document["rootFolderId"] = "0";
  document["fileMap"] = std::move(file_map);
  return document;
}

void render_web_view(const std::filesystem::path &web_dir, const FileCatalog &catalog, const ChunkDictionary &dictionary,
                     const std::string &root_name) {
  std::error_code ec;
  std::filesystem::create_directories(web_dir, ec);
  if (ec) {
    throw IoError(format_path_errno_error("Failed to create web view directory", web_dir.string(), ec.value()), web_dir.string(), ec.value());
  }

  const std::string json = build_file_map(catalog, dictionary, root_name).dump();
  write_text_file(web_dir / "FileMap.json", json + "\n");
  write_text_file(web_dir / "index.html", std::string(kPageHead) + escape_for_script(json) + kPageTail);
}

} // namespace archive_chunker
