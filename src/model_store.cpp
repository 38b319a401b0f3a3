/**
 * @file model_store.cpp
 * @brief Model catalog and selection
 */

#include "voxserve/model_store.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace voxserve {

const char* model_provider_name(ModelProvider provider) {
    switch (provider) {
        case ModelProvider::Local:   return "local";
        case ModelProvider::Command: return "command";
    }
    return "local";
}

void ModelStore::add_model(const ModelDescriptor& model) {
    auto it = std::find_if(models_.begin(), models_.end(),
                           [&](const ModelDescriptor& m) { return m.id == model.id; });
    if (it != models_.end()) {
        *it = model;
        if (model.id == current_id_) {
            loaded_ = false;
        }
        return;
    }
    models_.push_back(model);
}

size_t ModelStore::scan_directory(const std::string& directory) {
    std::error_code ec;
    if (directory.empty() || !fs::is_directory(directory, ec)) {
        std::cerr << "[ModelStore] Models directory not found: " << directory << std::endl;
        return 0;
    }

    std::vector<ModelDescriptor> found;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        std::string ext = entry.path().extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (ext != ".bin" && ext != ".gguf") {
            continue;
        }

        ModelDescriptor model;
        model.id = entry.path().stem().string();
        model.display_name = model.id;
        // whisper.cpp models ship as ggml-<name>.bin
        if (model.display_name.rfind("ggml-", 0) == 0) {
            model.display_name = model.display_name.substr(5);
        }
        model.provider = ModelProvider::Local;
        model.path = entry.path().string();
        model.size_bytes = entry.file_size(ec);
        found.push_back(model);
    }

    std::sort(found.begin(), found.end(),
              [](const ModelDescriptor& a, const ModelDescriptor& b) { return a.id < b.id; });
    for (const auto& model : found) {
        add_model(model);
    }

    std::cout << "[ModelStore] Found " << found.size() << " model(s) in " << directory << std::endl;
    return found.size();
}

bool ModelStore::select_model(const std::string& id) {
    if (!find(id)) {
        return false;
    }
    if (id != current_id_) {
        current_id_ = id;
        loaded_ = false;
    }
    return true;
}

void ModelStore::clear_selection() {
    current_id_.clear();
    loaded_ = false;
}

std::optional<ModelDescriptor> ModelStore::current_model() const {
    if (current_id_.empty()) {
        return std::nullopt;
    }
    return find(current_id_);
}

std::optional<ModelDescriptor> ModelStore::find(const std::string& id) const {
    for (const auto& model : models_) {
        if (model.id == id) {
            return model;
        }
    }
    return std::nullopt;
}

void ModelStore::mark_loaded(const std::string& id) {
    if (!current_id_.empty() && id == current_id_) {
        loaded_ = true;
    }
}

std::vector<std::string> ModelStore::available_model_names() const {
    std::vector<std::string> names;
    names.reserve(models_.size());
    for (const auto& model : models_) {
        names.push_back(model.display_name);
    }
    return names;
}

} // namespace voxserve
