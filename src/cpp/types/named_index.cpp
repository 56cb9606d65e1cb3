#include <atomvec/types/named_index.h>

namespace atomvec {

    NamedIndex::NamedIndex(const std::vector<std::string>& names) {
        for (size_t i = 0; i < names.size(); ++i) {
            if (names[i].empty()) continue;
            _positions[names[i]].push_back(i);
        }
    }

    std::optional<size_t> NamedIndex::first(const std::string& name) const {
        auto it = _positions.find(name);
        if (it == _positions.end()) return std::nullopt;
        return it->second.front();
    }

    const NamedIndex::PositionList& NamedIndex::positions(const std::string& name) const {
        static const PositionList none;
        auto it = _positions.find(name);
        return it == _positions.end() ? none : it->second;
    }

    NameTable& NameTable::operator=(const NameTable& other) {
        if (this != &other) {
            _names = other._names;
            invalidate();
        }
        return *this;
    }

    NameTable& NameTable::operator=(NameTable&& other) noexcept {
        if (this != &other) {
            _names = std::move(other._names);
            invalidate();
        }
        return *this;
    }

    const NamedIndex& NameTable::index() const {
        std::lock_guard lock(_index_mutex);
        if (!_index) {
            _index = std::make_shared<const NamedIndex>(_names);
        }
        return *_index;
    }

    void NameTable::set(size_t i, std::string name) {
        _names.at(i) = std::move(name);
        invalidate();
    }

    void NameTable::resize(size_t n) {
        _names.resize(n);
        invalidate();
    }

    void NameTable::append(const NameTable& other) {
        _names.insert(_names.end(), other._names.begin(), other._names.end());
        invalidate();
    }

    void NameTable::invalidate() {
        std::lock_guard lock(_index_mutex);
        _index.reset();
    }

} // namespace atomvec
