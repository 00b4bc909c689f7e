/**
 * =============================================================================
 * main.cpp - Transfer Learning Demo: Toaster / Not-Toaster
 * =============================================================================
 *
 * Runs the whole workflow once against the bundled assets:
 *
 *   1. Read images/tags.tsv and train on top of the Inception network
 *   2. Read images/test-tags.tsv, score it, print every prediction
 *   3. Print LogLoss and PerClassLogLoss for the test set
 *   4. Predict images/toaster3.jpg with a PredictionEngine
 *
 * USAGE:
 *   ./TransferLearning
 *
 * The assets root is fixed at build time (TRANSFER_LEARNING_ASSETS_DIR,
 * set by CMake to <source>/assets). The program waits for Enter before
 * exiting.
 *
 * @file main.cpp
 * @author Multi-Language AI System
 * @version 1.0.0
 */

// ============================================================================
// INCLUDES
// ============================================================================

#include "DatasetReader.hpp"
#include "Evaluator.hpp"
#include "ModelBuilder.hpp"
#include "PredictionEngine.hpp"
#include "Reporting.hpp"
#include "Settings.hpp"

#include <iostream>    // std::cout, std::cerr, std::cin

#ifndef TRANSFER_LEARNING_ASSETS_DIR
#define TRANSFER_LEARNING_ASSETS_DIR "assets"
#endif

int main() {
    try {
        const AssetPaths assets = AssetPaths::fromRoot(TRANSFER_LEARNING_ASSETS_DIR);

        std::cout << "=== Transfer Learning Image Classification ===" << std::endl;
        std::cout << "Assets: " << assets.assetsRoot << std::endl;

        // ====================================================================
        // TRAIN
        // ====================================================================

        std::cout << "\nReading training set " << assets.trainTagsTsv << std::endl;
        std::vector<ImageData> trainingData = readFromTsv(assets.trainTagsTsv, assets.imagesFolder);

        ModelBuilder builder;
        std::shared_ptr<const TrainedModel> model = builder.fit(trainingData, assets.inceptionModel);

        // ====================================================================
        // EVALUATE
        // ====================================================================

        std::cout << "\n=== Test Set Predictions ===" << std::endl;
        std::vector<ImageData> testData = readFromTsv(assets.testTagsTsv, assets.imagesFolder);

        MulticlassEvaluator evaluator;
        // Fail before scoring anything if the test set has a new label
        MulticlassEvaluator::checkLabels(model->labelMap(), testData);

        std::vector<ImagePrediction> predictions = model->transform(testData);
        Reporting::displayResults(predictions, std::cout);

        std::cout << "\n=== Metrics ===" << std::endl;
        MulticlassMetrics metrics = evaluator.evaluate(model->labelMap(), predictions);
        Reporting::displayMetrics(metrics, std::cout);

        // ====================================================================
        // SINGLE PREDICTION
        // ====================================================================

        std::cout << "\n=== Single Prediction ===" << std::endl;
        PredictionEngine engine(model);

        ImageData single;
        single.imagePath = assets.predictSingleImage;
        Reporting::displayPrediction(engine.predict(single), std::cout);

        std::cout << "\nPress Enter to end the application." << std::endl;
        std::cin.get();

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
