#include <QApplication>
#include "MainWindow.hpp"
#include "../../platform/desktop/TomlConfig.hpp"

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);

    app.setApplicationName("Near Me Alerts");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Near Me");

    std::string configFile = "nearme.toml";
    const QStringList args = app.arguments();
    int configIndex = args.indexOf("--config");
    if (configIndex >= 0 && configIndex + 1 < args.size()) {
        configFile = args.at(configIndex + 1).toStdString();
    }

    nearme::qt::MainWindow window(nearme::TomlConfig::loadFromFile(configFile));
    window.show();

    return app.exec();
}
