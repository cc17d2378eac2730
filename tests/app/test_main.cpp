#include <QCoreApplication>
#include <catch2/catch_session.hpp>

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("booksum_app_tests");
    Catch::Session session;
    return session.run(argc, argv);
}
