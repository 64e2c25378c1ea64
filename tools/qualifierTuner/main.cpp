#include "analyser.hpp"
#include "mainWindow.hpp"

#include "common/logging.hpp"
#include "config/settings.hpp"

#include <QApplication>
#include <QStringList>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>

// Shows every stage of the avatar qualification for a set of image files.
// Usage: qualifierTuner <image> [<image> ...]
// The detector and thresholds come from the WHOISIT_* environment, the same way the service reads them.
int main(int argc, char** argv) {
	QApplication application(argc, argv);

	const whoisit::config::Settings settings = whoisit::config::loadSettings();
	whoisit::initLogging(settings.logging);
	for (const auto& problem: whoisit::config::validate(settings)) {
		spdlog::warn("Configuration: {}", problem);
	}

	std::shared_ptr<const whoisit::avatar::FaceDetector> detector = whoisit::avatar::createFaceDetector(settings.detector);
	if (!detector) {
		spdlog::error("Could not create the configured face detector");
		return 1;
	}

	QStringList files;
	for (int i = 1; i < argc; ++i) {
		files << QString::fromLocal8Bit(argv[i]);
	}
	if (files.isEmpty()) {
		spdlog::error("Usage: {} <image> [<image> ...]", argc > 0 ? argv[0] : "qualifierTuner");
		return 1;
	}

	whoisit::avatar::Analyser analyser(detector, settings.qualifier);

	whoisit::MainWindow window;
	window.resize(1400, 900);
	window.setFiles(files);
	window.setThreshold(settings.qualifier.confidenceThreshold);
	window.setSelectionChangedCallback([&](const QString& file, const double threshold) {
		analyser.config().confidenceThreshold = static_cast<float>(threshold);

		const auto analysis = analyser.analyse(std::filesystem::path(file.toStdString()));
		spdlog::info("{}: {}", file.toStdString(), analysis.summary);
		window.showAnalysis(analysis.mosaic, QString::fromStdString(analysis.summary), analysis.verdict.usable);
	});
	window.show();

	return application.exec();
}
