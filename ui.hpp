#pragma once

#include <QPaintEvent>
#include <QWidget>

#include "ptg2d.hpp"
#include "selection.hpp"


using namespace PTG;


class PTGWidget : public QWidget
{
    Q_OBJECT

public:
    explicit PTGWidget(unsigned int randomSeed, bool verbose, QWidget* parent = Q_NULLPTR);
    QSize sizeHint() const;

    const PlanarGraph& graph() const { return m_graph; }
    const SelectionAdapter& selection() const { return m_selection; }

public slots:
    void startGraph();
    void addRandomVertex();
    void beginAddVertex();
    void cancelAddVertex();
    void displayIndices(int isDisplayIndices);
    void toggleIndices();
    void displayHull(int isDisplayHull);
    void centerView();
    void zoomIn();
    void zoomOut();
    void setGoToVertex(int m);
    void goToVertex();
    void showAllVertices();
    void setInsertColor(int color);
    void prtScn();

signals:
    void indicesDisplayChanged(bool isDisplayIndices);

protected:
    void paintEvent(QPaintEvent*);

private:
    void graphChanged();
    QPointF sceneToScreen(const Point& xy) const;
    Point screenToScene(const QPointF& xy) const;
    void zoomAroundCenter(double factor);
    void paint_(QPaintDevice* pd);
    void mousePressEvent(QMouseEvent* event);
    void mouseMoveEvent(QMouseEvent* event);
    void mouseReleaseEvent(QMouseEvent*);
    void wheelEvent(QWheelEvent* event);
    void keyPressEvent(QKeyEvent* event);

private:
    PlanarGraph m_graph;
    SelectionAdapter m_selection;
    IdxList m_hull;
    bool m_isDisplayIndices;
    bool m_isDisplayHull;
    bool m_isDragging;
    int m_goToIdx;

    QPointF m_prevMousePos;
    QPointF m_translation;
    double m_scale;
};

class MainWindow : public QWidget
{
    Q_OBJECT

public:
    explicit MainWindow(unsigned int randomSeed, bool verbose, QWidget* parent = Q_NULLPTR);

private:
    PTGWidget* m_ptgWidget;
};
