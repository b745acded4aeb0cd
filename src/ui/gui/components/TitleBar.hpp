#ifndef SRC_UI_GUI_COMPONENTS_HPP_TITLEBAR_HPP
#define SRC_UI_GUI_COMPONENTS_HPP_TITLEBAR_HPP

#include <QHBoxLayout>
#include <QLabel>
#include <QPoint>
#include <QPushButton>
#include <QWidget>

class QMouseEvent;

// Replaces the native frame: shows the title, hides the window on close and lets the panel be dragged.
class TitleBar : public QWidget
{
    Q_OBJECT
public:
    explicit TitleBar(QWidget* parent = nullptr);

signals:
    void closeClicked();

protected:
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;

private:
    QLabel* m_titleLabel;
    QPushButton* m_closeBtn;
    QPoint m_dragOffset;
};

#endif // SRC_UI_GUI_COMPONENTS_HPP_TITLEBAR_HPP
