#ifndef EDITORCANVAS_H
#define EDITORCANVAS_H

#include <QPointF>
#include <QString>
#include <QWidget>

class AnnotationScene;
class ToolManager;

/**
 * @brief Widget hosting one annotation scene.
 *
 * Paints the scene, forwards pointer and keyboard input to the ToolManager
 * and provides the dialogs the editor asks for (text, color, width).
 */
class EditorCanvas : public QWidget
{
    Q_OBJECT

public:
    explicit EditorCanvas(AnnotationScene* scene, QWidget* parent = nullptr);
    ~EditorCanvas() override;

    ToolManager* toolManager() const { return m_toolManager; }

    void setOutputPath(const QString& path) { m_outputPath = path; }
    QString outputPath() const { return m_outputPath; }

    /**
     * @brief Write the composite image to path.
     * @return true on success; the scene is then marked as exported
     */
    bool exportTo(const QString& path);

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void mouseDoubleClickEvent(QMouseEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;
    void closeEvent(QCloseEvent* event) override;

private:
    void setupToolManager();
    void requestTextInput(const QPointF& pos, const QString& initialText);
    void pickColor();
    void pickWidth();
    void saveStyle();
    void save();
    void updateWindowTitle();

    AnnotationScene* m_scene;
    ToolManager* m_toolManager;
    QString m_outputPath;
    QPointF m_lastPointerPos;
};

#endif // EDITORCANVAS_H
