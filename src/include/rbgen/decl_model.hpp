#pragma once

#include <rbgen/declaration.hpp>
#include <rbgen/xml_tree.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace rbgen {

  // The view of the host's symbol model the generator works against.
  class symbol_table {
  public:
    virtual ~symbol_table() = default;

    // Resolves a type reference (a qualified name) to a type declaration.
    // Returns nullptr if nothing matches.
    virtual const declaration*
    resolve(std::string_view type_ref) const = 0;

    // Every declaration carrying the given directive, in host order.
    virtual std::vector<const declaration*>
    annotated_with(std::string_view identity) const = 0;
  };

  // In-memory symbol model. Declarations have stable addresses for the
  // lifetime of the model, including across moves and merges.
  class decl_model : public symbol_table {
    std::vector<std::unique_ptr<declaration>> declarations_;

  public:
    decl_model() = default;

    decl_model(const decl_model&) = delete;
    decl_model&
    operator=(const decl_model&) = delete;
    decl_model(decl_model&&) noexcept = default;
    decl_model&
    operator=(decl_model&&) noexcept = default;

    // Reads a <model> document. Throws std::runtime_error on an
    // unexpected root or element.
    static decl_model
    load(const xml_node& root);

    declaration&
    add(std::string kind_name, std::string name,
        const declaration* enclosing = nullptr);

    void
    merge(decl_model&& other);

    const declaration*
    resolve(std::string_view type_ref) const override;

    std::vector<const declaration*>
    annotated_with(std::string_view identity) const override;

    std::size_t
    size() const {
      return declarations_.size();
    }

    const std::vector<std::unique_ptr<declaration>>&
    declarations() const {
      return declarations_;
    }
  };

} // namespace rbgen
