#ifndef SRC_UI_GUI_VIEWS_DASHBOARDVIEW_HPP
#define SRC_UI_GUI_VIEWS_DASHBOARDVIEW_HPP

#include "deckwarden/clipboard/ClipboardCopier.hpp"
#include "deckwarden/core/SessionOrchestrator.hpp"
#include "deckwarden/core/VaultItem.hpp"
#include <QFormLayout>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QPushButton>
#include <QString>
#include <QTimer>
#include <QWidget>
#include <optional>
#include <string>
#include <vector>

class DashboardView : public QWidget
{
    Q_OBJECT
public:
    DashboardView(deckwarden::core::SessionOrchestrator& orchestrator, deckwarden::clipboard::ClipboardCopier& copier,
                  QWidget* parent = nullptr);

    // 0 disables clearing the clipboard after a copy.
    void setClipboardTimeoutMs(int timeoutMs) noexcept;

    // Mirrors the orchestrator's session, busy state, results and selected item.
    void syncState();

    // Drops the search text and any copied secret still on the clipboard.
    void clearSensitiveFields();

signals:
    void settingsClicked();
    void commandFinished(bool succeeded, const QString& error);

private slots:
    void onSearchSubmitted();
    void onItemClicked(QListWidgetItem* item);
    void onSyncClicked();
    void onLockClicked();
    void onLogoutClicked();
    void clearClipboardIfUnchanged();

private: // NOLINT(readability-redundant-access-specifiers)
    enum class Field
    {
        Username,
        Password,
        Totp,
        Uri,
    };

    void setupUi();
    QPushButton* addCopyRow(QFormLayout* form, const QString& label, QLabel*& valueLabel, Field field);
    void rebuildList();
    void showDetail();
    void copyField(Field field);
    void reportCompletion(const deckwarden::core::CommandReport& report);
    void reportAdmission(deckwarden::core::Admission admission);

    deckwarden::core::SessionOrchestrator& m_orchestrator;
    deckwarden::clipboard::ClipboardCopier& m_copier;

    std::vector<deckwarden::core::VaultItemSummary> m_shownResults;
    QString m_lastCopied;
    int m_copyTimeoutMs{ 0 };

    QLabel* m_statusLabel{ nullptr };
    QLabel* m_errorLabel{ nullptr };
    QLineEdit* m_searchBar{ nullptr };
    QListWidget* m_listWidget{ nullptr };

    QWidget* m_detailPanel{ nullptr };
    QLabel* m_itemName{ nullptr };
    QLabel* m_usernameValue{ nullptr };
    QLabel* m_passwordValue{ nullptr };
    QLabel* m_totpValue{ nullptr };
    QLabel* m_uriValue{ nullptr };
    std::vector<QPushButton*> m_copyButtons;

    QPushButton* m_btnSearch{ nullptr };
    QPushButton* m_btnSync{ nullptr };
    QPushButton* m_btnLock{ nullptr };
    QPushButton* m_btnLogout{ nullptr };
    QPushButton* m_btnSettings{ nullptr };
    QTimer* m_clipboardTimer{ nullptr };
};

#endif // SRC_UI_GUI_VIEWS_DASHBOARDVIEW_HPP
