#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace rbgen {

  enum class decl_kind { namespace_, value_type, interface_like, other };

  // Classifies a host kind name. Names the host does not know (or that
  // this generator does not know) classify as `other`.
  decl_kind
  classify_kind(std::string_view kind_name);

  inline constexpr std::string_view namespace_kind_name = "namespace";
  inline constexpr std::string_view record_kind_name = "record";
  inline constexpr std::string_view interface_kind_name = "interface";

  using type_ref_list = std::vector<std::string>;
  using attribute_value = std::variant<bool, std::string, type_ref_list>;

  struct directive_attribute {
    std::string name;
    attribute_value value;

    bool
    operator==(const directive_attribute&) const = default;
  };

  class directive_instance {
    std::string identity_;
    std::vector<directive_attribute> attributes_;

  public:
    directive_instance() = default;

    explicit directive_instance(std::string identity,
                                std::vector<directive_attribute> attributes = {})
        : identity_(std::move(identity)), attributes_(std::move(attributes)) {}

    const std::string&
    identity() const {
      return identity_;
    }

    const std::vector<directive_attribute>&
    attributes() const {
      return attributes_;
    }

    const attribute_value*
    find(std::string_view name) const;

    bool
    operator==(const directive_instance&) const = default;
  };

  // A record component or an interface accessor.
  struct typed_name {
    std::string type;
    std::string name;

    bool
    operator==(const typed_name&) const = default;
  };

  class declaration {
    std::string kind_name_;
    std::string name_;
    const declaration* enclosing_ = nullptr;
    std::string header_;
    std::vector<typed_name> members_;
    std::vector<directive_instance> directives_;

  public:
    declaration(std::string kind_name, std::string name,
                const declaration* enclosing = nullptr)
        : kind_name_(std::move(kind_name)), name_(std::move(name)),
          enclosing_(enclosing) {}

    const std::string&
    kind_name() const {
      return kind_name_;
    }

    decl_kind
    kind() const {
      return classify_kind(kind_name_);
    }

    const std::string&
    simple_name() const {
      return name_;
    }

    // Dot-separated names of the enclosing chain and this declaration.
    // Unnamed enclosing namespaces contribute nothing.
    std::string
    qualified_name() const;

    const declaration*
    enclosing() const {
      return enclosing_;
    }

    const std::string&
    header() const {
      return header_;
    }

    void
    set_header(std::string header) {
      header_ = std::move(header);
    }

    const std::vector<typed_name>&
    members() const {
      return members_;
    }

    void
    add_member(typed_name member) {
      members_.push_back(std::move(member));
    }

    const std::vector<directive_instance>&
    directives() const {
      return directives_;
    }

    void
    add_directive(directive_instance directive) {
      directives_.push_back(std::move(directive));
    }

    const directive_instance*
    find_directive(std::string_view identity) const;
  };

} // namespace rbgen
