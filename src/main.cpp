#include <QApplication>
#include <QStyleFactory>
#include "compressioncodec.h"
#include "mainwindow.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    // Set application properties
    app.setApplicationName("QR Matrix Sender");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("QRMatrixSender");

    app.setStyle(QStyleFactory::create("Fusion"));

    // Fix the compression algorithm for the whole process before any file loads
    CompressionCodec::preferredAlgorithm();

    MainWindow window;
    window.show();

    return app.exec();
}
