/**
 * @file model_store.h
 * @brief Catalog of transcription models and the current selection
 *
 * ModelStore is plain mutable state with no internal locking. The
 * transcription coordinator keeps its instance inside the application state
 * and only touches it from the StateOwner thread.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace voxserve {

/**
 * @enum ModelProvider
 * @brief Which provider family executes a model
 */
enum class ModelProvider {
    Local,     ///< In-process engine (whisper.cpp model file)
    Command    ///< External transcription CLI
};

const char* model_provider_name(ModelProvider provider);

/**
 * @struct ModelDescriptor
 */
struct ModelDescriptor {
    std::string id;              ///< Stable identifier ("ggml-base.en")
    std::string display_name;    ///< Shown in /health ("base.en")
    ModelProvider provider = ModelProvider::Local;
    std::string path;            ///< Model file, empty for command models
    uint64_t size_bytes = 0;
};

class ModelStore {
public:
    /**
     * @brief Add or replace a catalog entry (matched by id)
     */
    void add_model(const ModelDescriptor& model);

    /**
     * @brief Register every *.bin / *.gguf file in a directory as a local model
     * @return Number of models added; 0 when the directory is missing
     */
    size_t scan_directory(const std::string& directory);

    /**
     * @brief Make a catalog entry the current model; clears the loaded flag
     * @return false if the id is unknown
     */
    bool select_model(const std::string& id);

    void clear_selection();

    std::optional<ModelDescriptor> current_model() const;
    std::optional<ModelDescriptor> find(const std::string& id) const;

    bool is_loaded() const { return loaded_; }

    /**
     * @brief Record a finished load; ignored unless id is still current
     */
    void mark_loaded(const std::string& id);
    void mark_unloaded() { loaded_ = false; }

    const std::vector<ModelDescriptor>& models() const { return models_; }
    std::vector<std::string> available_model_names() const;

private:
    std::vector<ModelDescriptor> models_;
    std::string current_id_;
    bool loaded_ = false;
};

} // namespace voxserve
