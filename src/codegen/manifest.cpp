#include "smartuuid/codegen/manifest.h"

namespace smartuuid::codegen {

namespace {

std::optional<CaseDecl> read_case(const nlohmann::json& node, const std::string& pointer,
                                  Diagnostics& errors) {
  CaseDecl decl;
  decl.pointer = pointer;

  // Shorthand: "Retail" is the unit case { "name": "Retail" }.
  if (node.is_string()) {
    decl.name = node.get<std::string>();
    return decl;
  }

  if (!node.is_object()) {
    errors.push_back(make_error(pointer, "case must be a string or an object"));
    return std::nullopt;
  }

  const auto name_it = node.find("name");
  if (name_it == node.end() || !name_it->is_string()) {
    errors.push_back(make_error(pointer_append(pointer, "name"), "case name must be a string"));
    return std::nullopt;
  }
  decl.name = name_it->get<std::string>();

  const auto fields_it = node.find("fields");
  if (fields_it != node.end()) {
    if (fields_it->is_array()) {
      decl.shape = CaseShape::kTuple;
    } else if (fields_it->is_object()) {
      decl.shape = CaseShape::kRecord;
    } else {
      errors.push_back(make_error(pointer_append(pointer, "fields"),
                                  "case fields must be an array or an object"));
      return std::nullopt;
    }
  }

  const auto attrs_it = node.find("attributes");
  if (attrs_it != node.end()) {
    if (!attrs_it->is_object()) {
      errors.push_back(
          make_error(pointer_append(pointer, "attributes"), "attributes must be an object"));
      return std::nullopt;
    }
    // Attributes other than uuid_type belong to other tools and are ignored.
    const auto uuid_type_it = attrs_it->find("uuid_type");
    if (uuid_type_it != attrs_it->end()) {
      decl.uuid_type_attr = *uuid_type_it;
    }
  }

  return decl;
}

std::optional<CategoryDecl> read_declaration(const nlohmann::json& node,
                                             const std::string& pointer, Diagnostics& errors) {
  if (!node.is_object()) {
    errors.push_back(make_error(pointer, "declaration must be an object"));
    return std::nullopt;
  }

  CategoryDecl decl;
  decl.pointer = pointer;

  const auto name_it = node.find("name");
  if (name_it == node.end() || !name_it->is_string()) {
    errors.push_back(
        make_error(pointer_append(pointer, "name"), "declaration name must be a string"));
    return std::nullopt;
  }
  decl.name = name_it->get<std::string>();

  const auto kind_it = node.find("kind");
  if (kind_it == node.end() || !kind_it->is_string()) {
    errors.push_back(
        make_error(pointer_append(pointer, "kind"), "declaration kind must be a string"));
    return std::nullopt;
  }
  decl.kind = kind_it->get<std::string>();

  // Non-enum declarations (structs) carry "fields" instead of "cases";
  // the derive step rejects them by kind, so a missing "cases" is not an error here.
  const auto cases_it = node.find("cases");
  if (cases_it == node.end()) {
    return decl;
  }
  if (!cases_it->is_array()) {
    errors.push_back(make_error(pointer_append(pointer, "cases"), "cases must be an array"));
    return std::nullopt;
  }

  const std::string cases_pointer = pointer_append(pointer, "cases");
  bool ok = true;
  for (std::size_t i = 0; i < cases_it->size(); ++i) {
    auto case_decl = read_case((*cases_it)[i], pointer_append(cases_pointer, i), errors);
    if (case_decl.has_value()) {
      decl.cases.push_back(std::move(case_decl.value()));
    } else {
      ok = false;
    }
  }
  if (!ok) {
    return std::nullopt;
  }
  return decl;
}

}  // namespace

ManifestResult parse_manifest(const nlohmann::json& document) {
  Diagnostics errors;
  Manifest manifest;

  if (!document.is_object()) {
    errors.push_back(make_error("", "manifest must be a JSON object"));
    return ManifestResult::err(std::move(errors));
  }

  const auto ns_it = document.find("namespace");
  if (ns_it != document.end()) {
    if (!ns_it->is_string()) {
      errors.push_back(make_error("/namespace", "namespace must be a string"));
    } else {
      manifest.name_space = ns_it->get<std::string>();
    }
  }

  const auto decls_it = document.find("declarations");
  if (decls_it == document.end() || !decls_it->is_array()) {
    errors.push_back(make_error("/declarations", "declarations must be an array"));
    return ManifestResult::err(std::move(errors));
  }

  for (std::size_t i = 0; i < decls_it->size(); ++i) {
    auto decl = read_declaration((*decls_it)[i], pointer_append("/declarations", i), errors);
    if (decl.has_value()) {
      manifest.declarations.push_back(std::move(decl.value()));
    }
  }

  if (!errors.empty()) {
    return ManifestResult::err(std::move(errors));
  }
  return ManifestResult::ok(std::move(manifest));
}

ManifestResult parse_manifest_text(const std::string_view text) {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    return ManifestResult::err(Diagnostics{make_error("", e.what())});
  }
  return parse_manifest(document);
}

}  // namespace smartuuid::codegen
