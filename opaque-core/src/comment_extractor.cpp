#include "comment_extractor.hpp"
#include "text_processor.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <tree_sitter/api.h>

extern "C" {
const TSLanguage *tree_sitter_c();
const TSLanguage *tree_sitter_cpp();
const TSLanguage *tree_sitter_javascript();
const TSLanguage *tree_sitter_python();
const TSLanguage *tree_sitter_rust();
const TSLanguage *tree_sitter_typescript();
const TSLanguage *tree_sitter_tsx();
}

namespace {

using LanguageFactory = const TSLanguage *(*)();

const std::unordered_map<std::string, LanguageFactory> &languageMap() {
  static const std::unordered_map<std::string, LanguageFactory> map = {
      {"c", tree_sitter_c},
      {"cpp", tree_sitter_cpp},
      {"c++", tree_sitter_cpp},
      {"javascript", tree_sitter_javascript},
      {"javascriptreact", tree_sitter_tsx},
      {"typescript", tree_sitter_typescript},
      {"typescriptreact", tree_sitter_tsx},
      {"tsx", tree_sitter_tsx},
      {"python", tree_sitter_python},
      {"rust", tree_sitter_rust}};
  return map;
}

const std::unordered_map<std::string, std::string> &extensionMap() {
  static const std::unordered_map<std::string, std::string> map = {
      {".py", "python"},      {".c", "c"},         {".h", "c"},
      {".cc", "cpp"},         {".cpp", "cpp"},     {".cxx", "cpp"},
      {".hh", "cpp"},         {".hpp", "cpp"},     {".js", "javascript"},
      {".mjs", "javascript"}, {".cjs", "javascript"},
      {".jsx", "javascriptreact"},
      {".ts", "typescript"},  {".tsx", "tsx"},     {".rs", "rust"}};
  return map;
}

inline bool isNewline(char c) { return c == '\n' || c == '\r'; }

} // namespace

namespace Opaque {
namespace comments {

const TSLanguage *resolveLanguage(const std::string &languageId) {
  const auto &map = languageMap();
  auto it = map.find(text::TextProcessor::toLower(languageId));
  if (it == map.end()) {
    return nullptr;
  }
  return it->second();
}

bool isLanguageSupported(const std::string &languageId) {
  const auto &map = languageMap();
  return map.find(text::TextProcessor::toLower(languageId)) != map.end();
}

std::string languageForPath(const std::string &path) {
  size_t slash = path.find_last_of("/\\");
  size_t dot = path.find_last_of('.');
  if (dot == std::string::npos ||
      (slash != std::string::npos && dot < slash)) {
    return "";
  }
  const auto &map = extensionMap();
  auto it = map.find(text::TextProcessor::toLower(path.substr(dot)));
  return it == map.end() ? "" : it->second;
}

std::vector<CommentSegment> extractComments(const std::string &languageId,
                                            const std::string &text) {
  std::vector<CommentSegment> segments;

  const TSLanguage *language = resolveLanguage(languageId);
  if (!language) {
    return segments;
  }

  std::unique_ptr<TSParser, decltype(&ts_parser_delete)> parser(
      ts_parser_new(), &ts_parser_delete);
  if (!parser || !ts_parser_set_language(parser.get(), language)) {
    return segments;
  }

  std::unique_ptr<TSTree, decltype(&ts_tree_delete)> tree(
      ts_parser_parse_string(parser.get(), nullptr, text.c_str(),
                             static_cast<uint32_t>(text.size())),
      &ts_tree_delete);
  if (!tree) {
    return segments;
  }

  TSNode root = ts_tree_root_node(tree.get());
  if (ts_node_is_null(root)) {
    return segments;
  }
  std::vector<TSNode> stack;
  stack.push_back(root);

  while (!stack.empty()) {
    TSNode node = stack.back();
    stack.pop_back();

    const char *type = ts_node_type(node);
    if (type && std::string_view(type).find("comment") !=
                    std::string_view::npos) {
      size_t start = ts_node_start_byte(node);
      size_t end = ts_node_end_byte(node);
      if (start < end && end <= text.size()) {
        CommentSegment segment;
        segment.startByte = start;
        segment.endByte = end;
        segment.text = text.substr(start, end - start);
        segments.push_back(std::move(segment));
      }
      continue;
    }

    uint32_t childCount = ts_node_child_count(node);
    for (uint32_t i = 0; i < childCount; ++i) {
      TSNode child = ts_node_child(node, i);
      if (!ts_node_is_null(child)) {
        stack.push_back(child);
      }
    }
  }

  std::sort(segments.begin(), segments.end(),
            [](const CommentSegment &a, const CommentSegment &b) {
              return a.startByte < b.startByte;
            });
  return segments;
}

std::string maskComments(const std::string &languageId,
                         const std::string &text) {
  std::string masked = text;
  for (const auto &segment : extractComments(languageId, text)) {
    for (size_t i = segment.startByte; i < segment.endByte; ++i) {
      if (!isNewline(masked[i])) {
        masked[i] = ' ';
      }
    }
  }
  return masked;
}

} // namespace comments
} // namespace Opaque
