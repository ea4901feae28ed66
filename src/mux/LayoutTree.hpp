#ifndef __PMX_LAYOUT_TREE__
#define __PMX_LAYOUT_TREE__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "PaneTypes.hpp"

namespace pmx {
/**
 * @brief A leaf of the layout: one session slot.
 *
 * The pane only carries identity and seed metadata; the live session lives
 * in the `SessionRegistry`.
 */
struct Pane {
  PaneId id;
  /** @brief Mirrored from the registry once the backend answers. */
  optional<BackendHandle> backendHandle;
  /** @brief Directory the session should start in, if known. */
  optional<string> startupDirectory;

  explicit Pane(PaneId _id = 0) : id(_id) {}
};

class LayoutNode;
typedef shared_ptr<const LayoutNode> LayoutNodePtr;

/**
 * @brief Immutable node of a layout tree: either a pane or a split.
 *
 * Nodes are never modified after construction.  Every tree operation builds
 * new nodes along the changed path and shares the rest, so any number of
 * tree versions can be held at once.
 */
class LayoutNode {
 public:
  static LayoutNodePtr makePane(const Pane& pane);
  /** @brief Builds a split.  `children` must hold at least two nodes. */
  static LayoutNodePtr makeSplit(SplitDirection direction,
                                 vector<LayoutNodePtr> children);

  inline bool isPane() const { return leaf; }
  inline const Pane& getPane() const { return pane; }
  inline SplitDirection getDirection() const { return direction; }
  inline const vector<LayoutNodePtr>& getChildren() const { return children; }

 protected:
  LayoutNode() : leaf(false), direction(SplitDirection::HORIZONTAL) {}

  bool leaf;
  Pane pane;
  SplitDirection direction;
  vector<LayoutNodePtr> children;
};

/** @brief Result of `LayoutTree::split`. */
struct SplitResult {
  LayoutNodePtr root;
  /** @brief Unset when the split was a no-op (unknown target or cap). */
  optional<PaneId> newPaneId;
};

/**
 * @brief Pure transforms over layout trees.
 *
 * None of these throw.  Referencing a pane that is not in the tree is a
 * silent no-op that returns the input root itself.
 */
class LayoutTree {
 public:
  static constexpr int DEFAULT_MAX_SAME_DIRECTION_PANES = 4;

  /** @brief A fresh single-pane tree. */
  static LayoutNodePtr createSinglePane(
      const optional<string>& startupDirectory = nullopt);

  /**
   * @brief Adds a pane next to `targetId`.
   *
   * When the target sits directly in a split of the same direction the new
   * pane is inserted right after it, unless that split already holds
   * `maxSameDirectionPanes` children (then nothing happens).  Otherwise the
   * target is wrapped in a new two-child split.
   */
  static SplitResult split(
      const LayoutNodePtr& root, PaneId targetId, SplitDirection direction,
      const optional<string>& startupDirectory = nullopt,
      int maxSameDirectionPanes = DEFAULT_MAX_SAME_DIRECTION_PANES);

  /**
   * @brief Removes `paneId`, collapsing single-child splits upward.
   * @return The new root, or nullptr when nothing is left.
   */
  static LayoutNodePtr close(const LayoutNodePtr& root, PaneId paneId);

  /** @brief Depth-first, children in order. */
  static vector<Pane> findAllPanes(const LayoutNodePtr& root);
  static optional<Pane> findPane(const LayoutNodePtr& root, PaneId paneId);
  static bool containsPane(const LayoutNodePtr& root, PaneId paneId);
  static int countPanes(const LayoutNodePtr& root);

  /** @brief Replaces one pane, copying only the path to it. */
  static LayoutNodePtr updatePane(const LayoutNodePtr& root, PaneId paneId,
                                  const std::function<Pane(const Pane&)>& fn);

  /**
   * @brief Neighbours in `findAllPanes` order, wrapping around.  An unknown
   * `current` yields the first pane.
   */
  static PaneId nextPane(const LayoutNodePtr& root, PaneId current);
  static PaneId prevPane(const LayoutNodePtr& root, PaneId current);

  /**
   * @brief Checks that every split has two or more children and never
   * directly contains a split of its own direction.
   */
  static bool isValid(const LayoutNodePtr& root);

  static bool structurallyEqual(const LayoutNodePtr& a, const LayoutNodePtr& b);

  static json toJson(const LayoutNodePtr& root);

 protected:
  static LayoutNodePtr splitNode(const LayoutNodePtr& node, PaneId targetId,
                                 SplitDirection direction,
                                 const optional<string>& startupDirectory,
                                 int maxSameDirectionPanes,
                                 optional<PaneId>* newPaneId);
  static LayoutNodePtr removeNode(const LayoutNodePtr& node, PaneId paneId,
                                  bool* changed);
  static void collectPanes(const LayoutNodePtr& node, vector<Pane>* panes);
  static LayoutNodePtr makeNewPane(const optional<string>& startupDirectory);
};
}  // namespace pmx

#endif  // __PMX_LAYOUT_TREE__
