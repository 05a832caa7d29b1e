#include <orchestration/state.hpp>

#include <algorithm>

namespace Orchestration
{
    namespace
    {
        template <typename ElementT, typename IdT, typename ProjectionT>
        ElementT const* findById(std::vector<ElementT> const& container, IdT const& id, ProjectionT projection)
        {
            auto iter = std::find_if(container.begin(), container.end(), [&](auto const& element) {
                return projection(element) == id;
            });
            return iter == container.end() ? nullptr : &*iter;
        }
    }

    ConnectionEntry const* State::findConnection(Ids::ConnectionId const& id) const
    {
        return findById(connections, id, [](ConnectionEntry const& entry) -> Ids::ConnectionId const& {
            return entry.record.id;
        });
    }

    Tab const* State::findTab(Ids::TabId const& id) const
    {
        return findById(tabs, id, [](Tab const& tab) -> Ids::TabId const& {
            return tab.id;
        });
    }

    Transfer const* State::findTransfer(Ids::TransferId const& id) const
    {
        return findById(transfers, id, [](Transfer const& transfer) -> Ids::TransferId const& {
            return transfer.id;
        });
    }

    Tab const* State::activeTab() const
    {
        if (!activeTabId)
            return nullptr;
        return findTab(*activeTabId);
    }
}
