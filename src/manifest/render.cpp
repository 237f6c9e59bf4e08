#include <statesync/manifest/render.hpp>

#include <fmt/format.h>
#include <algorithm>
#include <array>
#include <iterator>
#include <ranges>
#include <string_view>
#include <utility>

namespace statesync::manifest {

namespace {

using column_t = std::pair<std::string_view, std::size_t>;

template <std::size_t N>
void write_header(std::string& out, const std::array<column_t, N>& columns) {
  auto it = std::back_inserter(out);
  for (std::size_t i = 0; i < columns.size(); ++i) {
    fmt::format_to(it, "{}{:^{}}", i > 0 ? "|" : "", columns[i].first,
                   columns[i].second);
  }
  out.push_back('\n');
  for (std::size_t i = 0; i < columns.size(); ++i) {
    fmt::format_to(it, "{}{:-^{}}", i > 0 ? "+" : "", "", columns[i].second);
  }
  out.push_back('\n');
}

}  // namespace

std::string render_manifest(const schema::manifest& value) {
  auto max_path_len = std::size_t{6};
  if (!value->file_table.empty()) {
    max_path_len = std::ranges::max(
        value->file_table | std::views::transform([](const auto& file) {
          return file.relative_path.size();
        }));
  }

  auto out = std::string{};
  auto it = std::back_inserter(out);
  fmt::format_to(it, "MANIFEST VERSION: {}\n", schema::to_string(value->version));
  out.append("FILE TABLE\n");
  write_header(out, std::array{column_t{"idx", 12}, column_t{"size", 12},
                               column_t{"hash", 66},
                               column_t{"path", max_path_len}});
  for (std::size_t idx = 0; idx < value->file_table.size(); ++idx) {
    const auto& file = value->file_table[idx];
    fmt::format_to(it, " {:>10} | {:>10} | {:64} | {}\n", idx, file.size_bytes,
                   schema::to_hex(file.hash), file.relative_path);
  }

  out.append("CHUNK TABLE\n");
  write_header(out, std::array{column_t{"idx", 12}, column_t{"file_idx", 12},
                               column_t{"offset", 12}, column_t{"size", 12},
                               column_t{"hash", 66}});
  for (std::size_t idx = 0; idx < value->chunk_table.size(); ++idx) {
    const auto& chunk = value->chunk_table[idx];
    fmt::format_to(it, " {:>10} | {:>10} | {:>10} | {:>10} | {}\n", idx,
                   chunk.file_index, chunk.offset, chunk.size_bytes,
                   schema::to_hex(chunk.hash));
  }
  return out;
}

}  // namespace statesync::manifest

namespace statesync::schema {

std::string to_string(const manifest& value) {
  return statesync::manifest::render_manifest(value);
}

std::ostream& operator<<(std::ostream& out, const manifest& value) {
  return out << statesync::manifest::render_manifest(value);
}

}  // namespace statesync::schema
