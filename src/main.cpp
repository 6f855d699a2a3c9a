#include <QApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QImageReader>

#include "EditorCanvas.h"
#include "annotation/AnnotationScene.h"
#include "settings/AnnotationSettingsManager.h"
#include "version.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName(MARKUPSTUDIO_APP_NAME);
    app.setOrganizationName("MarkupStudio");
    app.setApplicationVersion(MARKUPSTUDIO_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Annotate an image with lines, arrows, shapes and text");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("image", "Image to annotate");
    parser.addOption({{"o", "output"}, "Export path used by Ctrl+S", "file"});
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }

    QImageReader reader(args.first());
    reader.setAutoTransform(true);
    const QImage image = reader.read();
    if (image.isNull()) {
        qWarning() << "Failed to load" << args.first() << "-" << reader.errorString();
        return 1;
    }

    AnnotationScene scene;
    auto& settings = AnnotationSettingsManager::instance();
    scene.setDefaultStyle(settings.loadStyle());
    scene.setFontFamily(settings.loadFontFamily());
    scene.loadBackground(image);

    EditorCanvas canvas(&scene);
    canvas.setOutputPath(parser.value("output"));
    canvas.show();

    return app.exec();
}
