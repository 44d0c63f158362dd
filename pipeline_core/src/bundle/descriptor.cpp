/**
 * @file descriptor.cpp
 * @brief Descriptor Generator implementation
 */

#include "Packwright/bundle/descriptor.hpp"
#include "Packwright/core/logger.hpp"

#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace Packwright::bundle {

void Descriptor::set(const std::string& key, DescriptorValue value) {
  for (auto& entry : m_entries) {
    if (entry.first == key) {
      entry.second = std::move(value);
      return;
    }
  }
  m_entries.emplace_back(key, std::move(value));
}

const DescriptorValue* Descriptor::find(std::string_view key) const {
  for (const auto& entry : m_entries) {
    if (entry.first == key) {
      return &entry.second;
    }
  }
  return nullptr;
}

const std::vector<std::string>& Descriptor::requiredKeys() {
  static const std::vector<std::string> keys = {
      DescriptorKeys::kDisplayName, DescriptorKeys::kIdentifier, DescriptorKeys::kVersion,
      DescriptorKeys::kShortVersion, DescriptorKeys::kHighResolutionCapable};
  return keys;
}

std::vector<std::string> Descriptor::missingRequiredKeys() const {
  std::vector<std::string> missing;
  for (const auto& key : requiredKeys()) {
    if (!contains(key)) {
      missing.push_back(key);
    }
  }
  return missing;
}

std::string Descriptor::escapeXml(std::string_view text) {
  std::string escaped;
  escaped.reserve(text.size());
  for (char c : text) {
    switch (c) {
    case '&':
      escaped += "&amp;";
      break;
    case '<':
      escaped += "&lt;";
      break;
    case '>':
      escaped += "&gt;";
      break;
    case '"':
      escaped += "&quot;";
      break;
    case '\'':
      escaped += "&apos;";
      break;
    default:
      escaped += c;
      break;
    }
  }
  return escaped;
}

std::string Descriptor::toPropertyList() const {
  std::ostringstream plist;
  plist << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
  plist << "<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" "
           "\"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n";
  plist << "<plist version=\"1.0\">\n";
  plist << "<dict>\n";

  for (const auto& [key, value] : m_entries) {
    plist << "  <key>" << escapeXml(key) << "</key>\n";
    if (const auto* flag = std::get_if<bool>(&value)) {
      plist << (*flag ? "  <true/>\n" : "  <false/>\n");
    } else {
      plist << "  <string>" << escapeXml(std::get<std::string>(value)) << "</string>\n";
    }
  }

  plist << "</dict>\n";
  plist << "</plist>\n";
  return plist.str();
}

Result<void> Descriptor::writeTo(const fs::path& path) const {
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    return Result<void>::error("Cannot create descriptor directory " +
                               path.parent_path().string() + ": " + ec.message());
  }

  fs::path tempPath = path;
  tempPath += ".tmp";

  {
    std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      return Result<void>::error("Cannot open descriptor for writing: " + tempPath.string());
    }
    out << toPropertyList();
    out.flush();
    if (!out) {
      out.close();
      fs::remove(tempPath, ec);
      return Result<void>::error("Failed to write descriptor: " + tempPath.string());
    }
  }

  fs::rename(tempPath, path, ec);
  if (ec) {
    std::error_code removeEc;
    fs::remove(tempPath, removeEc);
    return Result<void>::error("Failed to move descriptor into place at " + path.string() + ": " +
                               ec.message());
  }

  PACKWRIGHT_LOG_DEBUG("Wrote descriptor with ", m_entries.size(), " keys to ", path.string());
  return Result<void>::ok();
}

} // namespace Packwright::bundle
