#include <gtest/gtest.h>
#include <QCoreApplication>
#include <clocale>

// QtSql грузит драйверы через плагины: без приложения QSQLITE не найдётся
int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    std::setlocale(LC_TIME, "C");
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
