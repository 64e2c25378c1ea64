#pragma once

#include <QImage>
#include <QMainWindow>
#include <QStringList>
#include <QWidget>

#include <opencv2/core/mat.hpp>

#include <functional>

class QComboBox;
class QDoubleSpinBox;
class QLabel;

namespace whoisit {

//! Paints a cv::Mat scaled to the widget, keeping its aspect ratio.
class CvMatrixView : public QWidget {
public:
	explicit CvMatrixView(QWidget* parent = nullptr);
	void setMat(const cv::Mat& mat);

protected:
	void paintEvent(QPaintEvent* event) override;

private:
	static QImage toQImage(const cv::Mat& mat);

	QImage m_image{};
};


class MainWindow : public QMainWindow {
public:
	explicit MainWindow(QWidget* parent = nullptr);
	~MainWindow() override;

	void setFiles(const QStringList& files);
	void setThreshold(double threshold);
	void showAnalysis(const cv::Mat& mosaic, const QString& summary, bool usable);

	//! Called with the selected file and threshold whenever either changes.
	void setSelectionChangedCallback(std::function<void(const QString&, double)> callback);

private:
	void buildLayout();
	void notifySelection();

private:
	CvMatrixView* m_matrixView{nullptr};
	QComboBox* m_fileCombo{nullptr};
	QDoubleSpinBox* m_thresholdSpin{nullptr};
	QLabel* m_verdictLabel{nullptr};
	std::function<void(const QString&, double)> m_selectionChanged{};
};

} // namespace whoisit
