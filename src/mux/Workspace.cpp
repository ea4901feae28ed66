#include "Workspace.hpp"

#include "JsonLib.hpp"

namespace pmx {
Workspace::Workspace(shared_ptr<SessionRegistry> _registry,
                     const WorkspaceConfig& _config)
    : registry(_registry),
      config(_config),
      lifetimeToken(new bool(true)) {
  registry->setBackendAttachedCallback(
      [this](PaneId paneId, BackendHandle handle) {
        mirrorBackendHandle(paneId, handle);
      });
  addTab();
}

Workspace::~Workspace() {
  registry->setBackendAttachedCallback(
      SessionRegistry::BackendAttachedCallback());
}

TabId Workspace::addTab(const string& name,
                        const optional<string>& startupDirectory) {
  Tab tab;
  tab.id = sole::uuid4().str();
  tab.name = trim(name).empty() ? string("Terminal") : trim(name);
  tab.root = LayoutTree::createSinglePane(startupDirectory);
  tab.activePaneId = tab.root->getPane().id;
  tabs.push_back(tab);
  activeTabId = tab.id;
  LOG(INFO) << "New tab " << tab.id << " with "
            << paneIdToString(tab.activePaneId);
  return tab.id;
}

bool Workspace::closeTab(const TabId& tabId) {
  if (tabs.size() <= 1) {
    LOG(INFO) << "Refusing to close the last tab";
    return false;
  }
  size_t index = 0;
  for (; index < tabs.size(); index++) {
    if (tabs[index].id == tabId) {
      break;
    }
  }
  if (index == tabs.size()) {
    VLOG(1) << "Tried to close unknown tab " << tabId;
    return false;
  }
  LayoutNodePtr root = tabs[index].root;
  tabs.erase(tabs.begin() + index);
  releasePanes(root);
  if (activeTabId == tabId) {
    activeTabId = tabs[std::min(index, tabs.size() - 1)].id;
  }
  LOG(INFO) << "Closed tab " << tabId;
  return true;
}

bool Workspace::setActiveTab(const TabId& tabId) {
  if (!findTab(tabId)) {
    return false;
  }
  activeTabId = tabId;
  return true;
}

bool Workspace::renameTab(const TabId& tabId, const string& name) {
  Tab* tab = findTab(tabId);
  string trimmed = trim(name);
  if (!tab || trimmed.empty()) {
    return false;
  }
  tab->name = trimmed;
  return true;
}

bool Workspace::reorderTabs(int fromIndex, int toIndex) {
  int count = int(tabs.size());
  if (fromIndex < 0 || fromIndex >= count || toIndex < 0 || toIndex >= count) {
    return false;
  }
  Tab moved = tabs[fromIndex];
  tabs.erase(tabs.begin() + fromIndex);
  tabs.insert(tabs.begin() + toIndex, moved);
  return true;
}

void Workspace::focusNextTab() {
  for (size_t a = 0; a < tabs.size(); a++) {
    if (tabs[a].id == activeTabId) {
      activeTabId = tabs[(a + 1) % tabs.size()].id;
      return;
    }
  }
}

void Workspace::focusPrevTab() {
  for (size_t a = 0; a < tabs.size(); a++) {
    if (tabs[a].id == activeTabId) {
      activeTabId = tabs[(a + tabs.size() - 1) % tabs.size()].id;
      return;
    }
  }
}

bool Workspace::setActivePane(const TabId& tabId, PaneId paneId) {
  Tab* tab = findTab(tabId);
  if (!tab || !LayoutTree::containsPane(tab->root, paneId)) {
    return false;
  }
  tab->activePaneId = paneId;
  return true;
}

optional<PaneId> Workspace::splitPane(const TabId& tabId, PaneId paneId,
                                      SplitDirection direction,
                                      const optional<string>& startupDirectory) {
  Tab* tab = findTab(tabId);
  if (!tab) {
    return nullopt;
  }
  SplitResult result =
      LayoutTree::split(tab->root, paneId, direction, startupDirectory,
                        config.maxSameDirectionPanes);
  if (!result.newPaneId) {
    return nullopt;
  }
  tab->root = result.root;
  tab->activePaneId = *result.newPaneId;
  LOG(INFO) << "Split " << paneIdToString(paneId) << " "
            << directionToString(direction) << " into "
            << paneIdToString(*result.newPaneId);
  return result.newPaneId;
}

void Workspace::splitPaneInheritingCwd(
    const TabId& tabId, PaneId paneId, SplitDirection direction,
    std::function<void(optional<PaneId>)> callback) {
  weak_ptr<bool> alive(lifetimeToken);
  registry->getWorkingDirectory(
      paneId, [this, alive, tabId, paneId, direction,
               callback](optional<string> cwd) {
        if (alive.expired()) {
          return;
        }
        if (!cwd) {
          // Fall back to the directory the pane was started in
          const Tab* tab = getTab(tabId);
          if (tab) {
            auto pane = LayoutTree::findPane(tab->root, paneId);
            if (pane) {
              cwd = pane->startupDirectory;
            }
          }
        }
        optional<PaneId> newPane = splitPane(tabId, paneId, direction, cwd);
        if (callback) {
          callback(newPane);
        }
      });
}

bool Workspace::closePane(const TabId& tabId, PaneId paneId) {
  Tab* tab = findTab(tabId);
  if (!tab || !LayoutTree::containsPane(tab->root, paneId)) {
    return false;
  }
  if (LayoutTree::countPanes(tab->root) <= 1) {
    LOG(INFO) << "Refusing to close the last pane of tab " << tabId;
    return false;
  }
  LayoutNodePtr newRoot = LayoutTree::close(tab->root, paneId);
  if (!newRoot) {
    STFATAL << "Closing " << paneIdToString(paneId)
            << " emptied a tab with several panes";
  }
  tab->root = newRoot;
  registry->release(paneId);
  if (tab->activePaneId == paneId) {
    tab->activePaneId = LayoutTree::findAllPanes(newRoot).front().id;
  }
  LOG(INFO) << "Closed " << paneIdToString(paneId);
  return true;
}

bool Workspace::focusNextPane(const TabId& tabId) {
  Tab* tab = findTab(tabId);
  if (!tab || LayoutTree::countPanes(tab->root) <= 1) {
    return false;
  }
  tab->activePaneId = LayoutTree::nextPane(tab->root, tab->activePaneId);
  return true;
}

bool Workspace::focusPrevPane(const TabId& tabId) {
  Tab* tab = findTab(tabId);
  if (!tab || LayoutTree::countPanes(tab->root) <= 1) {
    return false;
  }
  tab->activePaneId = LayoutTree::prevPane(tab->root, tab->activePaneId);
  return true;
}

shared_ptr<Session> Workspace::mountPane(PaneId paneId,
                                         shared_ptr<DisplaySurface> surface) {
  optional<TabId> tabId = findTabForPane(paneId);
  if (!tabId) {
    VLOG(1) << "Tried to mount unknown " << paneIdToString(paneId);
    return shared_ptr<Session>();
  }
  auto pane = LayoutTree::findPane(getTab(*tabId)->root, paneId);
  shared_ptr<Session> session =
      registry->acquire(paneId, pane->startupDirectory);
  registry->attachDisplay(paneId, surface);
  return session;
}

void Workspace::unmountPane(PaneId paneId,
                            const shared_ptr<DisplaySurface>& surface) {
  registry->detachDisplay(paneId, surface);
}

bool Workspace::paneNeedsCloseConfirmation(PaneId paneId) {
  return registry->getActivityTracker()->isActive(paneId);
}

bool Workspace::tabNeedsCloseConfirmation(const TabId& tabId) {
  const Tab* tab = getTab(tabId);
  if (!tab) {
    return false;
  }
  for (const Pane& pane : LayoutTree::findAllPanes(tab->root)) {
    if (paneNeedsCloseConfirmation(pane.id)) {
      return true;
    }
  }
  return false;
}

const Tab& Workspace::getActiveTab() const {
  const Tab* tab = getTab(activeTabId);
  if (!tab) {
    STFATAL << "Active tab " << activeTabId << " is missing";
  }
  return *tab;
}

const Tab* Workspace::getTab(const TabId& tabId) const {
  for (const Tab& tab : tabs) {
    if (tab.id == tabId) {
      return &tab;
    }
  }
  return NULL;
}

Tab* Workspace::findTab(const TabId& tabId) {
  for (Tab& tab : tabs) {
    if (tab.id == tabId) {
      return &tab;
    }
  }
  return NULL;
}

optional<TabId> Workspace::findTabForPane(PaneId paneId) const {
  for (const Tab& tab : tabs) {
    if (LayoutTree::containsPane(tab.root, paneId)) {
      return tab.id;
    }
  }
  return nullopt;
}

Pane Workspace::getActivePane() const {
  const Tab& tab = getActiveTab();
  auto pane = LayoutTree::findPane(tab.root, tab.activePaneId);
  if (!pane) {
    STFATAL << "Active " << paneIdToString(tab.activePaneId)
            << " is not in tab " << tab.id;
  }
  return *pane;
}

optional<BackendHandle> Workspace::getActiveBackendHandle() const {
  return getActivePane().backendHandle;
}

int Workspace::numPanes() const {
  int count = 0;
  for (const Tab& tab : tabs) {
    count += LayoutTree::countPanes(tab.root);
  }
  return count;
}

void Workspace::mirrorBackendHandle(PaneId paneId, BackendHandle handle) {
  for (Tab& tab : tabs) {
    LayoutNodePtr newRoot =
        LayoutTree::updatePane(tab.root, paneId, [handle](const Pane& pane) {
          Pane updated(pane);
          updated.backendHandle = handle;
          return updated;
        });
    if (newRoot != tab.root) {
      tab.root = newRoot;
      return;
    }
  }
}

void Workspace::releasePanes(const LayoutNodePtr& root) {
  for (const Pane& pane : LayoutTree::findAllPanes(root)) {
    registry->release(pane.id);
  }
}

string Workspace::toJsonString() const {
  json state;
  state["shell"] = config.shell;
  state["activeTab"] = activeTabId;
  state["tabs"] = json::array();
  int order = 0;
  for (const Tab& tab : tabs) {
    json t;
    t["id"] = tab.id;
    t["name"] = tab.name;
    t["order"] = order++;
    t["activePane"] = paneIdToString(tab.activePaneId);
    t["root"] = LayoutTree::toJson(tab.root);
    state["tabs"].push_back(t);
  }

  state["sessions"] = json::object();
  for (PaneId paneId : registry->getPaneIds()) {
    shared_ptr<Session> session = registry->get(paneId);
    json s;
    if (session->getBackendHandle()) {
      s["backendHandle"] = *session->getBackendHandle();
    } else {
      s["backendHandle"] = nullptr;
    }
    if (session->getFailure()) {
      s["failure"] = *session->getFailure();
    }
    if (session->getLastKnownWorkingDirectory()) {
      s["cwd"] = *session->getLastKnownWorkingDirectory();
    }
    s["exited"] = session->hasExited();
    s["attached"] = bool(session->getDisplaySurface());
    s["active"] = registry->getActivityTracker()->isActive(paneId);
    state["sessions"][paneIdToString(paneId)] = s;
  }
  return state.dump();
}
}  // namespace pmx
