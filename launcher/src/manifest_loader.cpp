/**
 * @file manifest_loader.cpp
 * @brief Manifest loading with QJsonDocument
 */

#include "Packwright/launcher/manifest_loader.hpp"
#include "Packwright/core/logger.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>

namespace Packwright::launcher {

using pipeline::PipelineConfig;

namespace {

// ============================================================================
// Typed field readers
// ============================================================================

Result<void> readString(const QJsonObject& obj, const char* key, const std::string& context,
                        std::string& out) {
  if (!obj.contains(key)) {
    return Result<void>::ok();
  }
  const QJsonValue value = obj.value(key);
  if (!value.isString()) {
    return Result<void>::error(context + "." + key + " must be a string");
  }
  out = value.toString().toStdString();
  return Result<void>::ok();
}

Result<void> readBool(const QJsonObject& obj, const char* key, const std::string& context,
                      bool& out) {
  if (!obj.contains(key)) {
    return Result<void>::ok();
  }
  const QJsonValue value = obj.value(key);
  if (!value.isBool()) {
    return Result<void>::error(context + "." + key + " must be true or false");
  }
  out = value.toBool();
  return Result<void>::ok();
}

Result<void> readCount(const QJsonObject& obj, const char* key, const std::string& context,
                       u32& out) {
  if (!obj.contains(key)) {
    return Result<void>::ok();
  }
  const QJsonValue value = obj.value(key);
  if (!value.isDouble() || value.toDouble() < 0 || value.toDouble() != value.toInt()) {
    return Result<void>::error(context + "." + key + " must be a non-negative integer");
  }
  out = static_cast<u32>(value.toInt());
  return Result<void>::ok();
}

Result<void> readStringList(const QJsonObject& obj, const char* key,
                            std::vector<std::string>& out) {
  if (!obj.contains(key)) {
    return Result<void>::ok();
  }
  const QJsonValue value = obj.value(key);
  if (!value.isArray()) {
    return Result<void>::error(std::string(key) + " must be an array of strings");
  }

  std::vector<std::string> items;
  for (const QJsonValue& item : value.toArray()) {
    if (!item.isString()) {
      return Result<void>::error(std::string(key) + " must contain only strings");
    }
    items.push_back(item.toString().toStdString());
  }
  out = std::move(items);
  return Result<void>::ok();
}

Result<QJsonObject> readSection(const QJsonObject& root, const char* key) {
  if (!root.contains(key)) {
    return Result<QJsonObject>::ok(QJsonObject());
  }
  const QJsonValue value = root.value(key);
  if (!value.isObject()) {
    return Result<QJsonObject>::error(std::string(key) + " must be an object");
  }
  return Result<QJsonObject>::ok(value.toObject());
}

// Runs each reader in turn and stops at the first error
template <typename... Readers> Result<void> readAll(Readers&&... readers) {
  Result<void> result = Result<void>::ok();
  ((result.isOk() ? (result = readers(), 0) : 0), ...);
  return result;
}

// ============================================================================
// Sections
// ============================================================================

Result<void> parseApp(const QJsonObject& app, PipelineConfig& config) {
  const std::string ctx = "app";
  return readAll([&] { return readString(app, "name", ctx, config.appName); },
                 [&] { return readString(app, "identifier", ctx, config.identifier); },
                 [&] { return readString(app, "version", ctx, config.version); },
                 [&] { return readString(app, "shortVersion", ctx, config.shortVersion); },
                 [&] { return readString(app, "executable", ctx, config.executableName); },
                 [&] {
                   return readString(app, "minimumSystemVersion", ctx,
                                     config.minimumSystemVersion);
                 },
                 [&] {
                   return readBool(app, "highResolutionCapable", ctx,
                                   config.highResolutionCapable);
                 },
                 [&] { return readString(app, "icon", ctx, config.iconPath); });
}

Result<void> parsePaths(const QJsonObject& paths, const QString& baseDir,
                        PipelineConfig& config) {
  const std::string ctx = "paths";
  std::string projectRoot = ".";
  std::string output = config.outputDir.string();
  std::string staging;
  std::string artifact;

  auto result = readAll([&] { return readString(paths, "projectRoot", ctx, projectRoot); },
                        [&] { return readString(paths, "output", ctx, output); },
                        [&] { return readString(paths, "staging", ctx, staging); },
                        [&] { return readString(paths, "artifact", ctx, artifact); });
  if (result.isError()) {
    return result;
  }

  const QString rootPath =
      QDir::cleanPath(QDir(baseDir).absoluteFilePath(QString::fromStdString(projectRoot)));
  config.projectRoot = rootPath.toStdString();
  config.outputDir = output;
  config.stagingDir = staging;
  config.artifactDir = artifact;
  return Result<void>::ok();
}

Result<void> parseResources(const QJsonObject& root, PipelineConfig& config) {
  if (!root.contains("resources")) {
    return Result<void>::ok();
  }
  const QJsonValue value = root.value("resources");
  if (!value.isArray()) {
    return Result<void>::error("resources must be an array");
  }

  const QJsonArray array = value.toArray();
  for (int i = 0; i < array.size(); ++i) {
    const std::string ctx = "resources[" + std::to_string(i) + "]";
    if (!array.at(i).isObject()) {
      return Result<void>::error(ctx + " must be an object");
    }
    const QJsonObject obj = array.at(i).toObject();

    bundle::ResourceMapping mapping;
    auto result = readAll([&] { return readString(obj, "source", ctx, mapping.source); },
                          [&] { return readString(obj, "destination", ctx, mapping.destination); });
    if (result.isError()) {
      return result;
    }
    if (mapping.source.empty()) {
      return Result<void>::error(ctx + ".source is required");
    }
    config.resources.push_back(std::move(mapping));
  }
  return Result<void>::ok();
}

Result<void> parseSigning(const QJsonObject& signing, PipelineConfig& config) {
  const std::string ctx = "signing";
  auto& s = config.signing;
  return readAll([&] { return readBool(signing, "enabled", ctx, s.enabled); },
                 [&] { return readString(signing, "identity", ctx, s.identity); },
                 [&] { return readString(signing, "entitlements", ctx, s.entitlements); },
                 [&] { return readBool(signing, "hardenedRuntime", ctx, s.hardenedRuntime); },
                 [&] { return readString(signing, "tool", ctx, s.toolPath); });
}

Result<void> parseImage(const QJsonObject& image, PipelineConfig& config) {
  const std::string ctx = "image";
  auto& img = config.image;
  return readAll([&] { return readBool(image, "enabled", ctx, img.enabled); },
                 [&] { return readString(image, "format", ctx, img.format); },
                 [&] { return readString(image, "volumeName", ctx, img.volumeName); },
                 [&] { return readString(image, "tool", ctx, img.toolPath); },
                 [&] { return readBool(image, "checksum", ctx, img.writeChecksum); });
}

Result<void> parseReadiness(const QJsonObject& readiness, PipelineConfig& config) {
  const std::string ctx = "readiness";
  auto& r = config.readiness;
  return readAll([&] { return readCount(readiness, "maxAttempts", ctx, r.maxAttempts); },
                 [&] { return readCount(readiness, "intervalMs", ctx, r.intervalMs); },
                 [&] { return readCount(readiness, "deadlineMs", ctx, r.deadlineMs); });
}

Result<void> parseDescriptorExtras(const QJsonObject& descriptor, PipelineConfig& config) {
  for (auto it = descriptor.constBegin(); it != descriptor.constEnd(); ++it) {
    const std::string key = it.key().toStdString();
    if (it.value().isString()) {
      config.extraDescriptorKeys.emplace_back(key, it.value().toString().toStdString());
    } else if (it.value().isBool()) {
      config.extraDescriptorKeys.emplace_back(key, it.value().toBool());
    } else {
      return Result<void>::error("descriptor." + key + " must be a string or a boolean");
    }
  }
  return Result<void>::ok();
}

} // namespace

// ============================================================================
// ManifestLoader
// ============================================================================

Result<PipelineConfig> ManifestLoader::loadFromFile(const std::string& path) {
  const QString filePath = QString::fromStdString(path);
  QFile file(filePath);
  if (!file.exists()) {
    return Result<PipelineConfig>::error("Manifest not found: " + path);
  }
  if (!file.open(QIODevice::ReadOnly)) {
    return Result<PipelineConfig>::error("Failed to open manifest: " + path);
  }

  const QByteArray data = file.readAll();
  file.close();

  PACKWRIGHT_LOG_DEBUG("Loaded manifest ", path);
  return loadFromString(data.toStdString(), QFileInfo(filePath).absolutePath().toStdString());
}

Result<PipelineConfig> ManifestLoader::loadFromString(const std::string& json,
                                                      const std::string& baseDir) {
  QJsonParseError error;
  const QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(json), &error);
  if (error.error != QJsonParseError::NoError) {
    return Result<PipelineConfig>::error("Failed to parse manifest JSON: " +
                                         error.errorString().toStdString() + " at offset " +
                                         std::to_string(error.offset));
  }
  if (!doc.isObject()) {
    return Result<PipelineConfig>::error("Manifest root must be a JSON object");
  }
  return fromJson(doc.object(), QString::fromStdString(baseDir));
}

Result<PipelineConfig> ManifestLoader::fromJson(const QJsonObject& root, const QString& baseDir) {
  PipelineConfig config;

  auto fail = [](const Result<void>& result) {
    return Result<PipelineConfig>::error("Invalid manifest: " + result.error());
  };

  const char* sectionNames[] = {"app", "paths", "signing", "image", "readiness", "descriptor"};
  QJsonObject sections[6];
  for (int i = 0; i < 6; ++i) {
    auto section = readSection(root, sectionNames[i]);
    if (section.isError()) {
      return Result<PipelineConfig>::error("Invalid manifest: " + section.error());
    }
    sections[i] = section.value();
  }

  Result<void> result = parseApp(sections[0], config);
  if (result.isError()) {
    return fail(result);
  }
  result = parsePaths(sections[1], baseDir, config);
  if (result.isError()) {
    return fail(result);
  }
  result = parseResources(root, config);
  if (result.isError()) {
    return fail(result);
  }
  result = readStringList(root, "exclude", config.excludedResourceNames);
  if (result.isError()) {
    return fail(result);
  }
  result = readStringList(root, "helperDirectories", config.helperDirectories);
  if (result.isError()) {
    return fail(result);
  }

  if (root.contains("permissionBits")) {
    if (!root.value("permissionBits").isString()) {
      return Result<PipelineConfig>::error(
          "Invalid manifest: permissionBits must be an octal string such as \"0755\"");
    }
    auto bits = pipeline::parsePermissionBits(root.value("permissionBits").toString().toStdString());
    if (bits.isError()) {
      return Result<PipelineConfig>::error("Invalid manifest: " + bits.error());
    }
    config.permissionBits = bits.value();
  }

  result = parseSigning(sections[2], config);
  if (result.isError()) {
    return fail(result);
  }
  result = parseImage(sections[3], config);
  if (result.isError()) {
    return fail(result);
  }
  result = parseReadiness(sections[4], config);
  if (result.isError()) {
    return fail(result);
  }
  result = parseDescriptorExtras(sections[5], config);
  if (result.isError()) {
    return fail(result);
  }

  if (root.contains("postProcessingEnv")) {
    if (!root.value("postProcessingEnv").isString()) {
      return Result<PipelineConfig>::error("Invalid manifest: postProcessingEnv must be a string");
    }
    config.postProcessingEnv = root.value("postProcessingEnv").toString().toStdString();
  }

  return Result<PipelineConfig>::ok(std::move(config));
}

} // namespace Packwright::launcher
