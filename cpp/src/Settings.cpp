/**
 * @file Settings.cpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

#include "Settings.hpp"

#include <filesystem>  // std::filesystem::path for portable path joining

AssetPaths AssetPaths::fromRoot(const std::string& root) {
    namespace fs = std::filesystem;

    const fs::path assets(root);
    const fs::path images = assets / "images";

    AssetPaths paths;
    paths.assetsRoot = assets.string();
    paths.imagesFolder = images.string();
    paths.trainTagsTsv = (images / "tags.tsv").string();
    paths.testTagsTsv = (images / "test-tags.tsv").string();
    paths.predictSingleImage = (images / "toaster3.jpg").string();
    paths.inceptionModel = (assets / "inception" / "tensorflow_inception_graph.onnx").string();
    return paths;
}
