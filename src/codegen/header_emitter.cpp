#include "smartuuid/codegen/header_emitter.h"

#include "smartuuid/core/version.h"

#include <iomanip>
#include <sstream>

namespace smartuuid::codegen {

namespace {

std::string qualified_type(const DescriptorSet& set, const CategoryDescriptor& d) {
  if (set.name_space.empty()) {
    return "::" + d.name;
  }
  return "::" + set.name_space + "::" + d.name;
}

void emit_enum(std::ostringstream& out, const CategoryDescriptor& d) {
  out << "enum class " << d.name << " : std::uint8_t {\n";
  for (const auto& c : d.cases) {
    out << "  " << c.name << " = " << static_cast<unsigned>(c.discriminant) << ",  // prefix "
        << cpp_string_literal(c.prefix) << "\n";
  }
  out << "};\n";
}

void emit_traits(std::ostringstream& out, const std::string& type, const CategoryDescriptor& d) {
  out << "template <>\n"
      << "struct category_traits<" << type << "> {\n"
      << "  static constexpr std::string_view kTypeName = " << cpp_string_literal(d.type_name)
      << ";\n"
      << "  static constexpr std::size_t kCount = " << d.cases.size() << ";\n\n";

  out << "  [[nodiscard]] static constexpr std::uint8_t discriminant(const " << type
      << " value) noexcept {\n"
      << "    return static_cast<std::uint8_t>(value);\n"
      << "  }\n\n";

  out << "  [[nodiscard]] static constexpr std::optional<" << type
      << "> from_discriminant(const std::uint8_t value) noexcept {\n"
      << "    switch (value) {\n";
  for (const auto& c : d.cases) {
    out << "      case " << static_cast<unsigned>(c.discriminant) << ":\n"
        << "        return " << type << "::" << c.name << ";\n";
  }
  out << "      default:\n"
      << "        return std::nullopt;\n"
      << "    }\n"
      << "  }\n\n";

  out << "  [[nodiscard]] static constexpr std::string_view prefix(const " << type
      << " value) noexcept {\n"
      << "    switch (value) {\n";
  for (const auto& c : d.cases) {
    out << "      case " << type << "::" << c.name << ":\n"
        << "        return " << cpp_string_literal(c.prefix) << ";\n";
  }
  out << "    }\n"
      << "    return {};\n"
      << "  }\n"
      << "};\n";
}

}  // namespace

std::string cpp_string_literal(const std::string_view text) {
  std::ostringstream out;
  out << '"';
  for (const char ch : text) {
    const auto byte = static_cast<unsigned char>(ch);
    if (ch == '"' || ch == '\\') {
      out << '\\' << ch;
    } else if (byte < 0x20 || byte >= 0x7F) {
      // Octal escapes never swallow following digits beyond three.
      out << '\\' << std::oct << std::setw(3) << std::setfill('0') << static_cast<unsigned>(byte)
          << std::dec;
    } else {
      out << ch;
    }
  }
  out << '"';
  return out.str();
}

std::string emit_header(const DescriptorSet& set, const std::string_view source_name) {
  std::ostringstream out;

  out << "// Generated by smartuuid_gen " << core::kBuildVersion << " from " << source_name
      << ". Do not edit.\n"
      << "// Discriminants follow declaration order: reordering or inserting cases renumbers\n"
      << "// them and invalidates identifiers already stored or sent over the wire.\n"
      << "#pragma once\n\n"
      << "#include \"smartuuid/category/category_traits.h\"\n\n"
      << "#include <cstddef>\n"
      << "#include <cstdint>\n"
      << "#include <optional>\n"
      << "#include <string_view>\n\n";

  if (!set.name_space.empty()) {
    out << "namespace " << set.name_space << " {\n\n";
  }
  for (const auto& d : set.descriptors) {
    emit_enum(out, d);
    out << "\n";
  }
  if (!set.name_space.empty()) {
    out << "}  // namespace " << set.name_space << "\n\n";
  }

  out << "namespace smartuuid {\n\n";
  for (std::size_t i = 0; i < set.descriptors.size(); ++i) {
    if (i > 0) {
      out << "\n";
    }
    emit_traits(out, qualified_type(set, set.descriptors[i]), set.descriptors[i]);
  }
  out << "\n}  // namespace smartuuid\n";

  return out.str();
}

}  // namespace smartuuid::codegen
