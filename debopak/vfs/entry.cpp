#include "entry.hpp"

#include "../core/error.hpp"

#include <algorithm>

namespace debopak::vfs {

namespace {

template <typename Children>
auto find_by_name(Children& children, std::string_view name) {
    return std::find_if(children.begin(), children.end(),
                        [name](const Entry& e) { return e.name() == name; });
}

template <typename EntryT>
EntryT* resolve(EntryT* node, std::string_view path) {
    while (node && !path.empty()) {
        const auto slash = path.find('/');
        const std::string_view part = path.substr(0, slash);
        path = (slash == std::string_view::npos) ? std::string_view{} : path.substr(slash + 1);

        if (part.empty()) {
            continue;  // tolerate "a//b" and a trailing '/'
        }
        if (!node->is_directory()) {
            return nullptr;
        }
        node = node->find_child(part);
    }
    return node;
}

} // namespace

Entry Entry::make_file(std::string name, std::uint64_t size) {
    Entry e;
    e.name_ = std::move(name);
    e.attributes_ = 0;
    e.data_ = FileData{0, size, size};
    return e;
}

Entry Entry::make_directory(std::string name) {
    Entry e;
    e.name_ = std::move(name);
    e.attributes_ = PAK_ATTR_DIRECTORY;
    e.data_ = DirectoryData{};
    return e;
}

void Entry::set_attributes(std::uint32_t attributes) {
    if (is_directory()) {
        attributes_ = attributes | PAK_ATTR_DIRECTORY;
    } else {
        attributes_ = attributes & ~PAK_ATTR_DIRECTORY;
    }
}

const FileData& Entry::file() const {
    const auto* f = std::get_if<FileData>(&data_);
    if (!f) {
        throw PakError(ErrorKind::NotAFile, "entry is a directory", std::nullopt, name_);
    }
    return *f;
}

FileData& Entry::file() {
    auto* f = std::get_if<FileData>(&data_);
    if (!f) {
        throw PakError(ErrorKind::NotAFile, "entry is a directory", std::nullopt, name_);
    }
    return *f;
}

const std::vector<Entry>& Entry::children() const {
    static const std::vector<Entry> kNoChildren;
    const auto* d = std::get_if<DirectoryData>(&data_);
    return d ? d->children : kNoChildren;
}

std::vector<Entry>& Entry::mutable_children() {
    auto* d = std::get_if<DirectoryData>(&data_);
    if (!d) {
        throw PakError(ErrorKind::NotADirectory, "entry is a file", std::nullopt, name_);
    }
    return d->children;
}

Entry& Entry::add_child(Entry child) {
    auto& children = mutable_children();
    if (find_by_name(children, child.name()) != children.end()) {
        throw PakError(ErrorKind::InvalidName, "duplicate sibling name", std::nullopt, child.name());
    }
    children.push_back(std::move(child));
    return children.back();
}

bool Entry::remove_child(std::string_view name) {
    auto& children = mutable_children();
    auto it = find_by_name(children, name);
    if (it == children.end()) {
        return false;
    }
    children.erase(it);
    return true;
}

bool Entry::replace_child(std::string_view name, Entry child) {
    auto& children = mutable_children();
    auto it = find_by_name(children, name);
    if (it == children.end()) {
        return false;
    }
    if (child.name() != name && find_by_name(children, child.name()) != children.end()) {
        throw PakError(ErrorKind::InvalidName, "duplicate sibling name", std::nullopt, child.name());
    }
    *it = std::move(child);
    return true;
}

const Entry* Entry::find_child(std::string_view name) const {
    const auto& c = children();
    auto it = find_by_name(c, name);
    return it == c.end() ? nullptr : &*it;
}

Entry* Entry::find_child(std::string_view name) {
    auto* d = std::get_if<DirectoryData>(&data_);
    if (!d) {
        return nullptr;
    }
    auto it = find_by_name(d->children, name);
    return it == d->children.end() ? nullptr : &*it;
}

const Entry* Entry::find(std::string_view path) const {
    return resolve(this, path);
}

Entry* Entry::find(std::string_view path) {
    return resolve(this, path);
}

void Entry::set_payload(Bytes data) {
    (void)file();
    replacement_ = std::make_shared<const Bytes>(std::move(data));
}

void Entry::clear_payload() {
    replacement_.reset();
}

bool Entry::operator==(const Entry& other) const {
    if (name_ != other.name_ || attributes_ != other.attributes_ || timestamp_ != other.timestamp_) {
        return false;
    }
    if (is_file() != other.is_file()) {
        return false;
    }
    if (is_file()) {
        const FileData& a = std::get<FileData>(data_);
        const FileData& b = std::get<FileData>(other.data_);
        return a.offset == b.offset && a.size == b.size && a.storedSize == b.storedSize;
    }
    return children() == other.children();
}

} // namespace debopak::vfs
