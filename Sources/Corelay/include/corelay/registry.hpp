#pragma once

#ifdef __cplusplus

#include "field.hpp"
#include <initializer_list>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace corelay {

/// A single named field declaration inside CORELAY_FIELDS.
struct declaration {
    std::string name;
    std::shared_ptr<const field> spec;
};

/// Ordered field declarations of one type, including everything inherited.
class registry {
public:
    using entry_t = std::pair<std::string, std::shared_ptr<const field>>;

    explicit registry(std::string name);

    /// Copies `parent` and layers `declarations` on top. A redeclared name keeps
    /// its position and takes the new descriptor; new names are appended.
    static registry derive(std::string name, const registry& parent,
                           std::initializer_list<declaration> declarations);

    const std::string& name() const { return name_; }
    bool contains(const std::string& field_name) const;
    const std::shared_ptr<const field>& get(const std::string& field_name) const;

    std::vector<std::string> names() const;
    std::size_t size() const { return entries_.size(); }
    const std::vector<entry_t>& entries() const { return entries_; }

    /// Fields whose descriptor is a `Kind`, in declaration order.
    template<typename Kind>
    std::vector<std::pair<std::string, std::shared_ptr<const Kind>>> collect() const {
        std::vector<std::pair<std::string, std::shared_ptr<const Kind>>> result;
        for (const auto& [field_name, spec] : entries_) {
            if (auto typed = std::dynamic_pointer_cast<const Kind>(spec)) {
                result.emplace_back(field_name, std::move(typed));
            }
        }
        return result;
    }

private:
    void declare(const std::string& field_name, std::shared_ptr<const field> spec);

    std::string name_;
    std::vector<entry_t> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace corelay

// ============================================================================
// Declaration macro
// ============================================================================

// Place at the top of a field container class body:
//
//   class scale : public corelay::stage {
//       CORELAY_FIELDS(scale, corelay::stage,
//           {"factor", corelay::make_param(corelay::kind::real, 1.0, {.identifier = true})})
//   public:
//       corelay::value operation(const corelay::value& input) override;
//   };
//
// The registry is built once, on first use. Leaves the class in private access.
#define CORELAY_FIELDS(cls, parent, ...) \
public: \
    static const ::corelay::registry& declared() { \
        static const ::corelay::registry reg = \
            ::corelay::registry::derive(#cls, parent::declared(), { __VA_ARGS__ }); \
        return reg; \
    } \
    const ::corelay::registry& fields() const override { return declared(); } \
    std::shared_ptr<::corelay::field_container> clone() const override { \
        return std::make_shared<cls>(*this); \
    } \
private:

#endif // __cplusplus
