#pragma once

#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

#include <yyjson.h>

namespace tmax::json {

// Owning wrapper around an immutable yyjson document.
class Document {
public:
  Document() = default;
  explicit Document(yyjson_doc *doc) : doc_(doc) {}
  Document(Document &&other) noexcept : doc_(other.doc_) { other.doc_ = nullptr; }
  Document &operator=(Document &&other) noexcept {
    if (this != &other) {
      reset();
      doc_ = other.doc_;
      other.doc_ = nullptr;
    }
    return *this;
  }
  Document(Document const &) = delete;
  Document &operator=(Document const &) = delete;

  ~Document() { reset(); }

  static Document parse(std::string_view payload) {
    return Document(yyjson_read(payload.data(), payload.size(),
                                static_cast<yyjson_read_flag>(0)));
  }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_val *root() const noexcept {
    return doc_ ? yyjson_doc_get_root(doc_) : nullptr;
  }

private:
  void reset() {
    if (doc_) {
      yyjson_doc_free(doc_);
      doc_ = nullptr;
    }
  }

  yyjson_doc *doc_ = nullptr;
};

// Owning wrapper around a mutable yyjson document used for writing.
class MutableDocument {
public:
  MutableDocument() : doc_(yyjson_mut_doc_new(nullptr)) {}
  MutableDocument(MutableDocument const &) = delete;
  MutableDocument &operator=(MutableDocument const &) = delete;

  ~MutableDocument() {
    if (doc_) {
      yyjson_mut_doc_free(doc_);
    }
  }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_mut_doc *doc() const noexcept { return doc_; }

  void set_root(yyjson_mut_val *value) {
    if (doc_) {
      yyjson_mut_doc_set_root(doc_, value);
    }
  }

  std::string write(char const *fallback) const {
    if (!doc_) {
      return fallback;
    }
    char *json = yyjson_mut_write(doc_, 0, nullptr);
    std::string result = json ? json : fallback;
    std::free(json);
    return result;
  }

private:
  yyjson_mut_doc *doc_ = nullptr;
};

inline std::string write_string_array(std::vector<std::string> const &values) {
  MutableDocument doc;
  if (!doc.is_valid()) {
    return "[]";
  }
  auto *native = doc.doc();
  auto *root = yyjson_mut_arr(native);
  doc.set_root(root);
  for (auto const &value : values) {
    yyjson_mut_arr_add_strncpy(native, root, value.data(), value.size());
  }
  return doc.write("[]");
}

// Non-string entries are skipped; malformed input yields an empty list.
inline std::vector<std::string> read_string_array(std::string_view payload) {
  std::vector<std::string> result;
  if (payload.empty()) {
    return result;
  }
  auto doc = Document::parse(payload);
  auto *root = doc.root();
  if (root == nullptr || !yyjson_is_arr(root)) {
    return result;
  }
  size_t idx, limit;
  yyjson_val *entry = nullptr;
  yyjson_arr_foreach(root, idx, limit, entry) {
    if (yyjson_is_str(entry)) {
      result.emplace_back(yyjson_get_str(entry), yyjson_get_len(entry));
    }
  }
  return result;
}

} // namespace tmax::json
