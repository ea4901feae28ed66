#ifndef __PMX_WORKSPACE_HPP__
#define __PMX_WORKSPACE_HPP__

#include "Headers.hpp"
#include "LayoutTree.hpp"
#include "SessionRegistry.hpp"
#include "WorkspaceConfig.hpp"

namespace pmx {
/** @brief One tab: a name, a layout tree and the focused pane. */
struct Tab {
  TabId id;
  string name;
  LayoutNodePtr root;
  PaneId activePaneId;
};

/**
 * @brief The ordered set of tabs, and the only entry point consumers use.
 *
 * Layout changes go through `LayoutTree` and sessions through the
 * `SessionRegistry`; the workspace keeps the two consistent.  Closing a pane
 * releases its session, while mounting and unmounting only rebinds the
 * display.  A tab always keeps at least one pane and the workspace at least
 * one tab.
 */
class Workspace {
 public:
  Workspace(shared_ptr<SessionRegistry> _registry,
            const WorkspaceConfig& _config);
  ~Workspace();

  /** @brief Creates a tab holding one new pane and makes it active. */
  TabId addTab(const string& name = string(),
               const optional<string>& startupDirectory = nullopt);
  /** @brief Refused (returns false) for the last remaining tab. */
  bool closeTab(const TabId& tabId);
  bool setActiveTab(const TabId& tabId);
  bool renameTab(const TabId& tabId, const string& name);
  bool reorderTabs(int fromIndex, int toIndex);
  void focusNextTab();
  void focusPrevTab();

  bool setActivePane(const TabId& tabId, PaneId paneId);
  /**
   * @brief Splits `paneId` inside `tabId`; the new pane becomes active.
   * @return The new pane, or nullopt for an unknown pane or the split cap.
   */
  optional<PaneId> splitPane(const TabId& tabId, PaneId paneId,
                             SplitDirection direction,
                             const optional<string>& startupDirectory = nullopt);
  /**
   * @brief Like `splitPane`, but seeds the new pane with the source pane's
   * current working directory once the backend reports it.
   */
  void splitPaneInheritingCwd(
      const TabId& tabId, PaneId paneId, SplitDirection direction,
      std::function<void(optional<PaneId>)> callback =
          std::function<void(optional<PaneId>)>());
  /** @brief Refused (returns false) for the last pane of a tab. */
  bool closePane(const TabId& tabId, PaneId paneId);
  bool focusNextPane(const TabId& tabId);
  bool focusPrevPane(const TabId& tabId);

  /**
   * @brief A container started showing `paneId`: acquire its session and
   * bind `surface` as its output.
   * @return The session, or nullptr when the pane is not in any tab.
   */
  shared_ptr<Session> mountPane(PaneId paneId,
                                shared_ptr<DisplaySurface> surface);
  /** @brief The container went away; the session keeps running. */
  void unmountPane(PaneId paneId, const shared_ptr<DisplaySurface>& surface);

  /** @brief True if the pane produced output within the idle threshold. */
  bool paneNeedsCloseConfirmation(PaneId paneId);
  bool tabNeedsCloseConfirmation(const TabId& tabId);

  const Tab& getActiveTab() const;
  inline const TabId& getActiveTabId() const { return activeTabId; }
  inline const vector<Tab>& getTabs() const { return tabs; }
  const Tab* getTab(const TabId& tabId) const;
  optional<TabId> findTabForPane(PaneId paneId) const;
  Pane getActivePane() const;
  optional<BackendHandle> getActiveBackendHandle() const;
  int numPanes() const;

  inline shared_ptr<SessionRegistry> getRegistry() { return registry; }
  inline const WorkspaceConfig& getConfig() const { return config; }

  /** @brief Tabs, layout trees and session status as JSON. */
  string toJsonString() const;

 protected:
  Tab* findTab(const TabId& tabId);
  void mirrorBackendHandle(PaneId paneId, BackendHandle handle);
  void releasePanes(const LayoutNodePtr& root);

  shared_ptr<SessionRegistry> registry;
  WorkspaceConfig config;
  vector<Tab> tabs;
  TabId activeTabId;
  shared_ptr<bool> lifetimeToken;
};
}  // namespace pmx

#endif  // __PMX_WORKSPACE_HPP__
