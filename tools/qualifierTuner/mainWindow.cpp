#include "mainWindow.hpp"

#include <QComboBox>
#include <QDoubleSpinBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QPainter>
#include <QVBoxLayout>

#include <opencv2/imgproc.hpp>

namespace whoisit {

CvMatrixView::CvMatrixView(QWidget* parent) : QWidget(parent) {
}

void CvMatrixView::setMat(const cv::Mat& mat) {
	m_image = toQImage(mat);
	update();
}

void CvMatrixView::paintEvent(QPaintEvent* event) {
	QWidget::paintEvent(event);

	QPainter painter(this);
	painter.fillRect(rect(), Qt::black);
	if (m_image.isNull()) {
		return;
	}

	const QImage scaled = m_image.scaled(size(), Qt::KeepAspectRatio, Qt::SmoothTransformation);
	painter.drawImage(QPoint((width() - scaled.width()) / 2, (height() - scaled.height()) / 2), scaled);
}

QImage CvMatrixView::toQImage(const cv::Mat& mat) {
	if (mat.empty()) {
		return {};
	}

	// Mosaics are 8-bit BGR. Anything else is stretched to 8 bits first.
	cv::Mat image8 = mat;
	if (mat.depth() != CV_8U) {
		cv::normalize(mat, image8, 0.0, 255.0, cv::NORM_MINMAX, CV_8U);
	}

	cv::Mat rgb;
	switch (image8.channels()) {
	case 1:
		cv::cvtColor(image8, rgb, cv::COLOR_GRAY2RGB);
		break;
	case 3:
		cv::cvtColor(image8, rgb, cv::COLOR_BGR2RGB);
		break;
	case 4:
		cv::cvtColor(image8, rgb, cv::COLOR_BGRA2RGB);
		break;
	default:
		return {};
	}

	// QImage does not own the buffer. Copy before `rgb` goes away.
	return QImage(rgb.data, rgb.cols, rgb.rows, static_cast<int>(rgb.step), QImage::Format_RGB888).copy();
}


MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
	setWindowTitle("Avatar Qualifier Tuner");
	buildLayout();
}

MainWindow::~MainWindow() = default;

void MainWindow::setFiles(const QStringList& files) {
	m_fileCombo->clear();
	m_fileCombo->addItems(files);
}

void MainWindow::setThreshold(const double threshold) {
	m_thresholdSpin->setValue(threshold);
}

void MainWindow::showAnalysis(const cv::Mat& mosaic, const QString& summary, const bool usable) {
	m_matrixView->setMat(mosaic);
	m_verdictLabel->setText(summary);
	m_verdictLabel->setStyleSheet(usable ? "color: #2e7d32; font-weight: bold;" : "color: #c62828; font-weight: bold;");
}

void MainWindow::setSelectionChangedCallback(std::function<void(const QString&, double)> callback) {
	m_selectionChanged = std::move(callback);
	notifySelection();
}

void MainWindow::buildLayout() {
	auto* rootWidget = new QWidget(this);
	auto* rootLayout = new QVBoxLayout(rootWidget);
	auto* controlRow = new QHBoxLayout();

	m_fileCombo = new QComboBox(rootWidget);
	m_fileCombo->setSizeAdjustPolicy(QComboBox::AdjustToContents);

	m_thresholdSpin = new QDoubleSpinBox(rootWidget);
	m_thresholdSpin->setRange(0.05, 1.0);
	m_thresholdSpin->setSingleStep(0.05);
	m_thresholdSpin->setDecimals(2);

	controlRow->addWidget(new QLabel("Avatar:", rootWidget));
	controlRow->addWidget(m_fileCombo);
	controlRow->addSpacing(16);
	controlRow->addWidget(new QLabel("Confidence threshold:", rootWidget));
	controlRow->addWidget(m_thresholdSpin);
	controlRow->addStretch(1);

	m_verdictLabel = new QLabel(rootWidget);
	m_matrixView   = new CvMatrixView(rootWidget);

	rootLayout->addLayout(controlRow);
	rootLayout->addWidget(m_verdictLabel);
	rootLayout->addWidget(m_matrixView, 1);
	setCentralWidget(rootWidget);

	connect(m_fileCombo, &QComboBox::currentIndexChanged, this, [this](int) { notifySelection(); });
	connect(m_thresholdSpin, &QDoubleSpinBox::valueChanged, this, [this](double) { notifySelection(); });
}

void MainWindow::notifySelection() {
	if (m_selectionChanged && m_fileCombo->currentIndex() >= 0) {
		m_selectionChanged(m_fileCombo->currentText(), m_thresholdSpin->value());
	}
}

} // namespace whoisit
