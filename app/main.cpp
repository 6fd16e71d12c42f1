#include "menu/canvas/menucanvas.h"
#include "menu/menusession.h"
#include "menu/menusessionregistry.h"
#include "menu/menuspawner.h"
#include "menu/menutreebuilder.h"

#include <QGuiApplication>
#include <QPainter>
#include <QSettings>

#include <SDL.h>

using namespace DropMenu;

// Small round swatch used as an entry icon
static QImage makeSwatch(const QColor& color)
{
    QImage image(12, 12, QImage::Format_ARGB32_Premultiplied);
    image.fill(Qt::transparent);

    QPainter p(&image);
    p.setRenderHint(QPainter::Antialiasing);
    p.setPen(Qt::NoPen);
    p.setBrush(color);
    p.drawEllipse(QRectF(1, 1, 10, 10));
    return image;
}

static MenuNode::Callback logAction(const char* name)
{
    return [name]() {
        SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "Selected %s", name);
    };
}

static std::unique_ptr<MenuNode> buildDemoMenu(MenuCanvas* canvas)
{
    MenuTreeBuilder b(QStringLiteral("Canvas"));

    b.pushSubmenu(QStringLiteral("File"));
        b.addShortcutAction(QStringLiteral("New"), QStringLiteral("Ctrl+N"), logAction("New"));
        b.addShortcutAction(QStringLiteral("Open..."), QStringLiteral("Ctrl+O"), logAction("Open"));
        b.pushSubmenu(QStringLiteral("Open Recent"));
            b.addAction(QStringLiteral("notes.txt"), logAction("notes.txt"));
            b.addAction(QStringLiteral("todo.md"), logAction("todo.md"));
            b.addSeparator();
            b.addAction(QStringLiteral("Clear Recent"), logAction("Clear Recent"));
        b.popMenu();
        b.addSeparator();
        b.addShortcutAction(QStringLiteral("Quit"), QStringLiteral("Ctrl+Q"), []() {
            QGuiApplication::quit();
        });
    b.popMenu();

    b.pushSubmenu(QStringLiteral("Background"));
        const QColor backgrounds[] = {
            QColor(32, 32, 32), QColor(24, 40, 64), QColor(56, 28, 44), QColor(28, 52, 36)
        };
        const char* names[] = { "Charcoal", "Navy", "Plum", "Forest" };
        for (int i = 0; i < 4; i++) {
            QColor color = backgrounds[i];
            b.addAction(makeSwatch(color.lighter(180)), QString::fromLatin1(names[i]),
                        [canvas, color]() { canvas->setBackgroundColor(color); });
        }
    b.popMenu();

    b.pushSubmenu(QStringLiteral("Zoom"), MenuNode::CenterScrollOnSelected);
        for (int percent = 25; percent <= 400; percent += 5) {
            b.addAction(QStringLiteral("%1%").arg(percent), logAction("zoom level"), percent == 100);
        }
    b.popMenu();

    b.addSeparator();
    b.addAction(QColor(232, 72, 72, 110), QStringLiteral("Delete"), logAction("Delete"));
    b.addAction(QStringLiteral("Paste"), logAction("Paste"))->setFlags(MenuNode::Disabled);

    return b.takeRoot();
}

int main(int argc, char* argv[])
{
    QCoreApplication::setOrganizationName("DropMenu");
    QCoreApplication::setApplicationName("dropmenu-demo");

    QGuiApplication app(argc, argv);

    SDL_LogSetPriority(SDL_LOG_CATEGORY_APPLICATION, SDL_LOG_PRIORITY_INFO);

    MenuStyle style = MenuStyle::defaults();
    try {
        if (argc > 1) {
            QSettings settings(QString::fromLocal8Bit(argv[1]), QSettings::IniFormat);
            style.loadOverrides(settings);
        }
        else {
            QSettings settings;
            style.loadOverrides(settings);
        }
    }
    catch (const ConfigurationError& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Invalid menu configuration: %s",
                     e.what());
        return 1;
    }

    MenuCanvas canvas;
    canvas.setTitle(QStringLiteral("DropMenu - right click anywhere"));
    canvas.resize(960, 640);

    std::unique_ptr<MenuNode> root = buildDemoMenu(&canvas);

    MenuSpawner spawner(&canvas, style);
    MenuSessionRegistry registry;

    spawner.onActionSelected = [](const MenuNode* node) {
        if (node == nullptr) {
            SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "Menu dismissed");
        }
    };
    spawner.onSessionEnded = [](MenuSession* session) {
        SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION,
                    "Menu session %p ended",
                    (void*)session);
    };

    QObject::connect(&canvas, &MenuCanvas::contextRequested,
                     [&](const QPointF& pos) {
        registry.track(spawner.open(root.get(), pos));
    });

    canvas.show();

    int ret = app.exec();

    registry.closeActive();
    return ret;
}
