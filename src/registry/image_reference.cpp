#include "unisrv/registry/image_reference.hpp"

#include "unisrv/common/fs.hpp"

#include <cctype>

namespace unisrv::registry {

namespace {

bool looks_like_registry(const std::string &component) {
  return component.find('.') != std::string::npos || component.find(':') != std::string::npos ||
         component == "localhost";
}

bool valid_repository(const std::string &repository) {
  if (repository.empty() || repository.front() == '/' || repository.back() == '/') {
    return false;
  }
  for (const char ch : repository) {
    const auto uch = static_cast<unsigned char>(ch);
    const bool allowed = std::islower(uch) != 0 || std::isdigit(uch) != 0 || ch == '.' ||
                         ch == '_' || ch == '-' || ch == '/';
    if (!allowed) {
      return false;
    }
  }
  return repository.find("//") == std::string::npos;
}

bool valid_tag(const std::string &tag) {
  if (tag.empty() || tag.size() > 128 || tag.front() == '.' || tag.front() == '-') {
    return false;
  }
  for (const char ch : tag) {
    const auto uch = static_cast<unsigned char>(ch);
    if (std::isalnum(uch) == 0 && ch != '_' && ch != '.' && ch != '-') {
      return false;
    }
  }
  return true;
}

} // namespace

common::Result<ImageReference> ImageReference::parse(const std::string &value) {
  using R = common::Result<ImageReference>;
  const std::string text = common::trim(value);
  if (text.empty()) {
    return R::failure("Invalid image reference: empty");
  }
  for (const char ch : text) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      return R::failure("Invalid image reference '" + value + "': contains whitespace");
    }
  }

  ImageReference reference;
  std::string remainder = text;

  if (const auto at = remainder.find('@'); at != std::string::npos) {
    const std::string digest = remainder.substr(at + 1);
    if (digest.find(':') == std::string::npos || digest.size() < 3) {
      return R::failure("Invalid image reference '" + value + "': malformed digest");
    }
    reference.digest = digest;
    remainder = remainder.substr(0, at);
  }

  const auto last_slash = remainder.rfind('/');
  const auto last_colon = remainder.rfind(':');
  if (last_colon != std::string::npos &&
      (last_slash == std::string::npos || last_colon > last_slash)) {
    const std::string tag = remainder.substr(last_colon + 1);
    if (!valid_tag(tag)) {
      return R::failure("Invalid image reference '" + value + "': invalid tag");
    }
    reference.tag = tag;
    remainder = remainder.substr(0, last_colon);
  }

  const auto first_slash = remainder.find('/');
  if (first_slash != std::string::npos && looks_like_registry(remainder.substr(0, first_slash))) {
    reference.registry = remainder.substr(0, first_slash);
    reference.repository = remainder.substr(first_slash + 1);
  } else {
    reference.registry = "docker.io";
    reference.repository = remainder;
  }

  if (reference.registry == "docker.io" || reference.registry == "registry-1.docker.io") {
    reference.registry = DOCKER_HUB_REGISTRY;
  }
  if (reference.is_docker_hub() && reference.repository.find('/') == std::string::npos) {
    reference.repository = "library/" + reference.repository;
  }

  if (!valid_repository(reference.repository)) {
    return R::failure("Invalid image reference '" + value +
                      "': repository must be lowercase [a-z0-9._-/]");
  }
  return R::success(std::move(reference));
}

std::string ImageReference::manifest_reference() const {
  if (digest.has_value()) {
    return *digest;
  }
  return tag.value_or("latest");
}

std::string ImageReference::to_string() const {
  std::string out = registry + "/" + repository;
  if (tag.has_value()) {
    out += ":" + *tag;
  }
  if (digest.has_value()) {
    out += "@" + *digest;
  }
  return out;
}

} // namespace unisrv::registry
