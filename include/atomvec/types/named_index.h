#ifndef ATOMVEC_TYPES_NAMED_INDEX_H
#define ATOMVEC_TYPES_NAMED_INDEX_H

#include <atomvec/atomvec_export.h>

#include <ankerl/unordered_dense.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace atomvec {

    /**
     * NamedIndex - name -> ascending positions (0-based) over a name table.
     *
     * Duplicate names are legal. Lookups by name follow the first-match policy: the
     * lowest position carrying the name wins. The empty string is the "no name" marker
     * and is never indexed, so it never matches.
     */
    class ATOMVEC_EXPORT NamedIndex {
    public:
        using PositionList = std::vector<size_t>;

        explicit NamedIndex(const std::vector<std::string>& names);

        [[nodiscard]] std::optional<size_t> first(const std::string& name) const;
        [[nodiscard]] const PositionList& positions(const std::string& name) const;
        [[nodiscard]] bool contains(const std::string& name) const { return _positions.contains(name); }
        [[nodiscard]] size_t distinct_names() const { return _positions.size(); }

    private:
        ankerl::unordered_dense::map<std::string, PositionList> _positions;
    };

    /**
     * NameTable - The name sequence of a vector plus its lazily built NamedIndex.
     *
     * The index is built on first lookup and discarded by any mutation. Building is
     * serialised by a mutex so concurrent readers of the same table are safe; mutation
     * requires exclusive access to the owning vector.
     */
    class ATOMVEC_EXPORT NameTable {
    public:
        NameTable() = default;
        explicit NameTable(std::vector<std::string> names) : _names{std::move(names)} {}

        NameTable(const NameTable& other) : _names{other._names} {}
        NameTable(NameTable&& other) noexcept : _names{std::move(other._names)} {}
        NameTable& operator=(const NameTable& other);
        NameTable& operator=(NameTable&& other) noexcept;

        [[nodiscard]] size_t size() const { return _names.size(); }
        [[nodiscard]] const std::vector<std::string>& names() const { return _names; }
        [[nodiscard]] const std::string& operator[](size_t i) const { return _names[i]; }

        [[nodiscard]] const NamedIndex& index() const;
        [[nodiscard]] std::optional<size_t> find(const std::string& name) const { return index().first(name); }

        void set(size_t i, std::string name);
        void resize(size_t n);
        void append(const NameTable& other);

        [[nodiscard]] bool operator==(const NameTable& other) const { return _names == other._names; }

    private:
        void invalidate();

        std::vector<std::string> _names;
        mutable std::mutex _index_mutex;
        mutable std::shared_ptr<const NamedIndex> _index;
    };

} // namespace atomvec

#endif // ATOMVEC_TYPES_NAMED_INDEX_H
