#pragma once

#include <QSortFilterProxyModel>

namespace planner {
namespace ui {

class TaskFilterProxyModel : public QSortFilterProxyModel
{
    Q_OBJECT

public:
    explicit TaskFilterProxyModel(QObject *parent = nullptr);

    void setFilterText(const QString &text);
    void setTagFilter(const QString &tag);
    void setHideCompleted(bool hide);

protected:
    bool filterAcceptsRow(int sourceRow, const QModelIndex &sourceParent) const override;

private:
    QString m_filterText;
    QString m_tagFilter;
    bool m_hideCompleted = false;
};

} // namespace ui
} // namespace planner
