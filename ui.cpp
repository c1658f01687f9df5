#include <algorithm>
#include <iostream>
#include <limits>

#include <QAbstractButton>
#include <QApplication>
#include <QCheckBox>
#include <QColor>
#include <QFile>
#include <QGridLayout>
#include <QHBoxLayout>
#include <QKeyEvent>
#include <QMessageBox>
#include <QMouseEvent>
#include <QPainter>
#include <QPixmap>
#include <QPushButton>
#include <QSpinBox>
#include <QWheelEvent>

#include "ui.hpp"


using namespace PTG;

static const QColor VERTEX_COLORS[] = {
    QColor(200, 50, 50),
    QColor(50, 200, 50),
    QColor(50, 50, 200),
    QColor(200, 200, 50),
};
static const int VERTEX_COLORS_CNT = sizeof(VERTEX_COLORS) / sizeof(VERTEX_COLORS[0]);
static const QColor BACKGROUND_COLOR(240, 240, 240);
static const QColor EDGE_COLOR(50, 50, 50);
static const QColor PERIPHERY_FILL_COLOR(200, 200, 255, 100);
static const QColor PERIPHERY_LINE_COLOR(100, 100, 200);
static const QColor HULL_COLOR(220, 120, 30);
static const QColor SELECTED_COLOR(255, 255, 0);
static const double ZOOM_STEP = 1.1;
static const QString SCREENSHOT_FILE = QStringLiteral("ptg_screenshot.png");

PTGWidget::PTGWidget(unsigned int randomSeed, bool verbose, QWidget* parent)
     :QWidget(parent)
     ,m_graph(randomSeed)
     ,m_selection(m_graph)
     ,m_isDisplayIndices(true)
     ,m_isDisplayHull(false)
     ,m_isDragging(false)
     ,m_goToIdx(1)
     ,m_translation(0., 0.)
     ,m_scale(1.0)
{
    setAutoFillBackground(false);
    setFocusPolicy(Qt::StrongFocus);
    m_graph.SetVerbose(verbose);
    m_graph.Reset();
}

QSize PTGWidget::sizeHint() const
{
    return QSize(1000, 700);
}

void PTGWidget::startGraph()
{
    m_selection.Reset();
    graphChanged();
}

void PTGWidget::addRandomVertex()
{
    if (m_graph.InsertRandom() == INVALID_VTX_IDX)
        std::cout << "no arc available for a random vertex" << std::endl;
    graphChanged();
}

void PTGWidget::beginAddVertex()
{
    m_selection.BeginAddVertex();
    update();
}

void PTGWidget::cancelAddVertex()
{
    m_selection.Cancel();
    update();
}

void PTGWidget::displayIndices(int isDisplayIndices)
{
    m_isDisplayIndices = (isDisplayIndices != 0);
    update();
}

void PTGWidget::toggleIndices()
{
    m_isDisplayIndices = !m_isDisplayIndices;
    emit indicesDisplayChanged(m_isDisplayIndices);
    update();
}

void PTGWidget::displayHull(int isDisplayHull)
{
    m_isDisplayHull = (isDisplayHull != 0);
    graphChanged();
}

void PTGWidget::centerView()
{
    m_translation = QPointF(0., 0.);
    m_scale = 1.0;
    update();
}

void PTGWidget::zoomIn()
{
    zoomAroundCenter(ZOOM_STEP);
}

void PTGWidget::zoomOut()
{
    zoomAroundCenter(1.0 / ZOOM_STEP);
}

void PTGWidget::setGoToVertex(int m)
{
    m_goToIdx = m;
}

void PTGWidget::goToVertex()
{
    m_graph.SetTruncation(static_cast<IdxType>(std::max(m_goToIdx, 0)));
    update();
}

void PTGWidget::showAllVertices()
{
    m_graph.ClearTruncation();
    update();
}

void PTGWidget::setInsertColor(int color)
{
    m_selection.SetColor(static_cast<ColorClass>(color));
}

void PTGWidget::prtScn()
{
    QFile file(SCREENSHOT_FILE);
    if (!file.open(QIODevice::WriteOnly))
    {
        QMessageBox::warning(
            this, tr("PTG"), tr("Could not open file ") + SCREENSHOT_FILE);
        return;
    }
    QPixmap pixmap(rect().size());
    pixmap.fill(Qt::transparent);
    paint_(&pixmap);
    pixmap.save(&file, "PNG");
}

void PTGWidget::graphChanged()
{
    if (m_isDisplayHull)
        m_hull = m_graph.RecomputeBoundary();
    else
        m_hull.clear();
    update();
}

void PTGWidget::paintEvent(QPaintEvent*)
{
    paint_(this);
}

QPointF PTGWidget::sceneToScreen(const Point& xy) const
{
    const QPointF screenCenter(width() / 2.0, height() / 2.0);
    return QPointF(m_scale * xy.X(), -m_scale * xy.Y()) + screenCenter +
           m_translation;
}

Point PTGWidget::screenToScene(const QPointF& xy) const
{
    const QPointF screenCenter(width() / 2.0, height() / 2.0);
    QPointF out = (xy - m_translation - screenCenter) / m_scale;
    return Point(out.x(), -out.y());
}

void PTGWidget::zoomAroundCenter(double factor)
{
    m_scale *= factor;
    m_translation *= factor;
    update();
}

void PTGWidget::paint_(QPaintDevice* pd)
{
    QPainter p(pd);
    p.setRenderHints(QPainter::Antialiasing);
    p.fillRect(QRect(0, 0, pd->width(), pd->height()), BACKGROUND_COLOR);
    if (m_graph.IsEmpty())
        return;
    QPen pen;
    pen.setCapStyle(Qt::RoundCap);
    // periphery
    const IdxList periphery = m_graph.GetVisiblePeriphery();
    if (periphery.size() > 2)
    {
        std::vector<QPointF> pts;
        pts.reserve(periphery.size());
        for (IdxType v : periphery)
            pts.push_back(sceneToScreen(m_graph.GetVertex(v).Pos()));
        pen.setWidthF(2.0);
        pen.setColor(PERIPHERY_LINE_COLOR);
        p.setPen(pen);
        p.setBrush(QBrush(PERIPHERY_FILL_COLOR));
        p.drawPolygon(pts.data(), static_cast<int>(pts.size()));
    }
    // edges
    pen.setWidthF(2.0);
    pen.setColor(EDGE_COLOR);
    p.setPen(pen);
    for (const Edge& edge : m_graph.GetVisibleEdges())
    {
        const Vertex& v1 = m_graph.GetVertex(edge.V1());
        const Vertex& v2 = m_graph.GetVertex(edge.V2());
        p.drawLine(sceneToScreen(v1.Pos()), sceneToScreen(v2.Pos()));
    }
    // recovered convex hull, hidden vertices dropped
    std::vector<QPointF> hullPts;
    for (IdxType v : m_graph.FilterVisible(m_hull))
        hullPts.push_back(sceneToScreen(m_graph.GetVertex(v).Pos()));
    if (hullPts.size() > 1)
    {
        pen.setColor(HULL_COLOR);
        pen.setStyle(Qt::DashLine);
        p.setPen(pen);
        p.setBrush(Qt::NoBrush);
        p.drawPolygon(hullPts.data(), static_cast<int>(hullPts.size()));
        pen.setStyle(Qt::SolidLine);
    }
    // vertices
    for (const Vertex* vtx : m_graph.GetVisibleVertices())
    {
        const QPointF pos = sceneToScreen(vtx->Pos());
        const double r = vtx->Radius() * m_scale;
        pen.setColor(Qt::black);
        pen.setWidthF(2.0);
        p.setPen(pen);
        p.setBrush(QBrush(VERTEX_COLORS[vtx->Color() % VERTEX_COLORS_CNT]));
        p.drawEllipse(pos, r, r);
        pen.setColor(Qt::white);
        p.setPen(pen);
        const QString label = m_isDisplayIndices ?
            QString::number(vtx->Index()) : QString::number(vtx->Color());
        p.drawText(QRectF(pos.x() - r, pos.y() - r, 2 * r, 2 * r), Qt::AlignCenter, label);
    }
    // selected vertices
    pen.setColor(SELECTED_COLOR);
    pen.setWidthF(3.0);
    p.setPen(pen);
    p.setBrush(Qt::NoBrush);
    for (IdxType v : m_selection.GetSelection())
    {
        const Vertex& vtx = m_graph.GetVertex(v);
        const double r = vtx.Radius() * m_scale + 5.0;
        p.drawEllipse(sceneToScreen(vtx.Pos()), r, r);
    }
    // mode and truncation indicators
    pen.setColor(Qt::black);
    p.setPen(pen);
    if (m_selection.GetState() != SelectionStateType::SS_IDLE)
    {
        p.drawText(QPointF(pd->width() - 150, 20),
                   QStringLiteral("Mode: ") + QString::fromLatin1(SelectionStateName(m_selection.GetState())));
    }
    if (m_graph.IsTruncated())
    {
        p.drawText(QPointF(pd->width() - 150, 40),
                   QStringLiteral("Up to vertex ") + QString::number(m_graph.GetTruncation()));
    }
}

void PTGWidget::mousePressEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton &&
        m_selection.GetState() != SelectionStateType::SS_IDLE)
    {
        const IdxType v = m_graph.FindVertexAt(screenToScene(event->pos()));
        const PickOutcomeType outcome = m_selection.OnVertexPicked(v);
        if (outcome != PickOutcomeType::PK_IGNORED)
        {
            graphChanged();
            return;
        }
    }
    m_isDragging = true;
    m_prevMousePos = event->pos();
    qApp->setOverrideCursor(Qt::ClosedHandCursor);
    setMouseTracking(true);
}

void PTGWidget::mouseMoveEvent(QMouseEvent* event)
{
    if (!m_isDragging)
        return;
    m_translation += (event->pos() - m_prevMousePos);
    m_prevMousePos = event->pos();
    update();
}

void PTGWidget::mouseReleaseEvent(QMouseEvent*)
{
    if (!m_isDragging)
        return;
    m_isDragging = false;
    qApp->restoreOverrideCursor();
    setMouseTracking(false);
}

void PTGWidget::wheelEvent(QWheelEvent* event)
{
    const double newScale =
        m_scale * std::max(0.3, (1. + event->delta() * 8e-4));
    if(m_scale == newScale)
    {
        return;
    }
    const QPointF cursor = event->posF();
    const Point scenePt = screenToScene(cursor);
    const QPointF screenCenter = QPointF(width(), height()) / 2.0;
    m_translation = cursor - newScale * QPointF(scenePt.X(), -scenePt.Y()) -
                    screenCenter;
    m_scale = newScale;
    update();
}

void PTGWidget::keyPressEvent(QKeyEvent* event)
{
    switch (event->key())
    {
    case Qt::Key_S:
        startGraph();
        break;
    case Qt::Key_R:
        addRandomVertex();
        break;
    case Qt::Key_A:
        beginAddVertex();
        break;
    case Qt::Key_Escape:
        cancelAddVertex();
        break;
    case Qt::Key_T:
        toggleIndices();
        break;
    case Qt::Key_C:
        centerView();
        break;
    case Qt::Key_Plus:
    case Qt::Key_Equal:
        zoomIn();
        break;
    case Qt::Key_Minus:
        zoomOut();
        break;
    case Qt::Key_G:
        goToVertex();
        break;
    default:
        QWidget::keyPressEvent(event);
    }
}

MainWindow::MainWindow(unsigned int randomSeed, bool verbose, QWidget* parent)
    : QWidget(parent)
{
    m_ptgWidget = new PTGWidget(randomSeed, verbose);
    m_ptgWidget->setMinimumSize(QSize(1, 1));
    // Right pane
    QPushButton* startBtn = new QPushButton(tr("Start (S)"));
    connect(startBtn, SIGNAL(clicked()), m_ptgWidget, SLOT(startGraph()));
    QPushButton* randomBtn = new QPushButton(tr("Random Vertex (R)"));
    connect(randomBtn, SIGNAL(clicked()), m_ptgWidget, SLOT(addRandomVertex()));
    QPushButton* addBtn = new QPushButton(tr("Add Vertex (A)"));
    connect(addBtn, SIGNAL(clicked()), m_ptgWidget, SLOT(beginAddVertex()));
    QPushButton* cancelBtn = new QPushButton(tr("Cancel (Esc)"));
    connect(cancelBtn, SIGNAL(clicked()), m_ptgWidget, SLOT(cancelAddVertex()));
    QSpinBox* colorSpin = new QSpinBox();
    colorSpin->setRange(0, m_ptgWidget->graph().GetColorClassCount() - 1);
    colorSpin->setPrefix(tr("Colour class "));
    connect(colorSpin, SIGNAL(valueChanged(int)), m_ptgWidget, SLOT(setInsertColor(int)));
    QCheckBox* displayIndices =
        new QCheckBox(QStringLiteral("Display indices (T)"));
    displayIndices->setChecked(true);
    connect(displayIndices, SIGNAL(stateChanged(int)), m_ptgWidget, SLOT(displayIndices(int)));
    connect(m_ptgWidget, SIGNAL(indicesDisplayChanged(bool)), displayIndices, SLOT(setChecked(bool)));
    QCheckBox* displayHull =
        new QCheckBox(QStringLiteral("Display convex hull"));
    connect(displayHull, SIGNAL(stateChanged(int)), m_ptgWidget, SLOT(displayHull(int)));
    QPushButton* centerBtn = new QPushButton(tr("Center (C)"));
    connect(centerBtn, SIGNAL(clicked()), m_ptgWidget, SLOT(centerView()));
    QPushButton* zoomInBtn = new QPushButton(tr("Zoom In (+)"));
    connect(zoomInBtn, SIGNAL(clicked()), m_ptgWidget, SLOT(zoomIn()));
    QPushButton* zoomOutBtn = new QPushButton(tr("Zoom Out (-)"));
    connect(zoomOutBtn, SIGNAL(clicked()), m_ptgWidget, SLOT(zoomOut()));
    QSpinBox* goToSpin = new QSpinBox();
    goToSpin->setRange(0, std::numeric_limits<int>::max());
    goToSpin->setValue(1);
    goToSpin->setPrefix(tr("Vertex "));
    connect(goToSpin, SIGNAL(valueChanged(int)), m_ptgWidget, SLOT(setGoToVertex(int)));
    QPushButton* goToBtn = new QPushButton(tr("Go to vertex (G)"));
    connect(goToBtn, SIGNAL(clicked()), m_ptgWidget, SLOT(goToVertex()));
    QPushButton* showAllBtn = new QPushButton(tr("Show all"));
    connect(showAllBtn, SIGNAL(clicked()), m_ptgWidget, SLOT(showAllVertices()));
    QPushButton* screenshotBtn = new QPushButton(tr("Screenshot"));
    connect(screenshotBtn, SIGNAL(clicked()), m_ptgWidget, SLOT(prtScn()));
    QGridLayout* rightLayout = new QGridLayout;
    int cntr = 0;
    rightLayout->addWidget(startBtn, cntr++, 0);
    rightLayout->addWidget(randomBtn, cntr++, 0);
    rightLayout->addWidget(addBtn, cntr++, 0);
    rightLayout->addWidget(cancelBtn, cntr++, 0);
    rightLayout->addWidget(colorSpin, cntr++, 0);
    rightLayout->addWidget(displayIndices, cntr++, 0);
    rightLayout->addWidget(displayHull, cntr++, 0);
    rightLayout->addWidget(centerBtn, cntr++, 0);
    rightLayout->addWidget(zoomInBtn, cntr++, 0);
    rightLayout->addWidget(zoomOutBtn, cntr++, 0);
    rightLayout->addWidget(goToSpin, cntr++, 0);
    rightLayout->addWidget(goToBtn, cntr++, 0);
    rightLayout->addWidget(showAllBtn, cntr++, 0);
    rightLayout->addWidget(screenshotBtn, cntr++, 0);
    rightLayout->setRowStretch(cntr, 1);
    // Center
    QHBoxLayout* centralLayout = new QHBoxLayout;
    centralLayout->addWidget(m_ptgWidget, 1);
    centralLayout->addLayout(rightLayout);
    setLayout(centralLayout);
    // keep the keyboard shortcuts on the canvas after a click
    const QList<QAbstractButton*> buttons = findChildren<QAbstractButton*>();
    for (QAbstractButton* btn : buttons)
        btn->setFocusPolicy(Qt::NoFocus);
    setWindowTitle(tr("Planar Triangulated Graph Visualizer"));
    m_ptgWidget->setFocus();
}
