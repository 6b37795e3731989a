#include <QCoreApplication>
#include <gtest/gtest.h>

int main(int argc, char **argv)
{
    // QSettings and QTemporaryDir expect an application instance
    QCoreApplication app(argc, argv);
    app.setOrganizationName("QRMatrixSenderTests");
    app.setApplicationName("qrmatrix_tests");

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
