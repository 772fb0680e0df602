#pragma once

#include "../messages.hpp"
#include "../service_provider.hpp"

namespace autobridge::actions {

// One overload per gated request type. The router visits the Request variant with
// these, so a request type without an overload does not compile.
// Collaborator errors propagate as exceptions; the router turns them into responses.

// Core
Response dispatch(const ServiceProvider& services, const PermissionsStatusRequest& request);
Response dispatch(const ServiceProvider& services, const ScriptingProbeRequest& request);
Response dispatch(const ServiceProvider& services, const DaemonStatusRequest& request);
Response dispatch(const ServiceProvider& services, const DaemonStopRequest& request);

// Capture
Response dispatch(const ServiceProvider& services, const CaptureScreenRequest& request);
Response dispatch(const ServiceProvider& services, const CaptureWindowRequest& request);
Response dispatch(const ServiceProvider& services, const CaptureFrontmostRequest& request);
Response dispatch(const ServiceProvider& services, const CaptureAreaRequest& request);
Response dispatch(const ServiceProvider& services, const DetectElementsRequest& request);

// Input
Response dispatch(const ServiceProvider& services, const ClickRequest& request);
Response dispatch(const ServiceProvider& services, const TypeRequest& request);
Response dispatch(const ServiceProvider& services, const TypeActionsRequest& request);
Response dispatch(const ServiceProvider& services, const ScrollRequest& request);
Response dispatch(const ServiceProvider& services, const HotkeyRequest& request);
Response dispatch(const ServiceProvider& services, const SwipeRequest& request);
Response dispatch(const ServiceProvider& services, const DragRequest& request);
Response dispatch(const ServiceProvider& services, const MoveMouseRequest& request);
Response dispatch(const ServiceProvider& services, const WaitForElementRequest& request);

// Windows
Response dispatch(const ServiceProvider& services, const ListWindowsRequest& request);
Response dispatch(const ServiceProvider& services, const FocusWindowRequest& request);
Response dispatch(const ServiceProvider& services, const MoveWindowRequest& request);
Response dispatch(const ServiceProvider& services, const ResizeWindowRequest& request);
Response dispatch(const ServiceProvider& services, const SetWindowBoundsRequest& request);
Response dispatch(const ServiceProvider& services, const CloseWindowRequest& request);
Response dispatch(const ServiceProvider& services, const MinimizeWindowRequest& request);
Response dispatch(const ServiceProvider& services, const MaximizeWindowRequest& request);
Response dispatch(const ServiceProvider& services, const GetFocusedWindowRequest& request);

// Applications
Response dispatch(const ServiceProvider& services, const ListApplicationsRequest& request);
Response dispatch(const ServiceProvider& services, const FindApplicationRequest& request);
Response dispatch(const ServiceProvider& services, const GetFrontmostApplicationRequest& request);
Response dispatch(const ServiceProvider& services, const IsApplicationRunningRequest& request);
Response dispatch(const ServiceProvider& services, const LaunchApplicationRequest& request);
Response dispatch(const ServiceProvider& services, const ActivateApplicationRequest& request);
Response dispatch(const ServiceProvider& services, const QuitApplicationRequest& request);
Response dispatch(const ServiceProvider& services, const HideApplicationRequest& request);
Response dispatch(const ServiceProvider& services, const UnhideApplicationRequest& request);
Response dispatch(const ServiceProvider& services, const HideOtherApplicationsRequest& request);
Response dispatch(const ServiceProvider& services, const ShowAllApplicationsRequest& request);

// Menus
Response dispatch(const ServiceProvider& services, const ListMenusRequest& request);
Response dispatch(const ServiceProvider& services, const ListFrontmostMenusRequest& request);
Response dispatch(const ServiceProvider& services, const ClickMenuItemRequest& request);
Response dispatch(const ServiceProvider& services, const ClickMenuItemByNameRequest& request);
Response dispatch(const ServiceProvider& services, const ListMenuExtrasRequest& request);
Response dispatch(const ServiceProvider& services, const ClickMenuExtraRequest& request);
Response dispatch(const ServiceProvider& services, const MenuExtraOpenMenuFrameRequest& request);
Response dispatch(const ServiceProvider& services, const ListMenuBarItemsRequest& request);
Response dispatch(const ServiceProvider& services, const ClickMenuBarItemNamedRequest& request);
Response dispatch(const ServiceProvider& services, const ClickMenuBarItemIndexRequest& request);

// Dock
Response dispatch(const ServiceProvider& services, const ListDockItemsRequest& request);
Response dispatch(const ServiceProvider& services, const LaunchDockItemRequest& request);
Response dispatch(const ServiceProvider& services, const RightClickDockItemRequest& request);
Response dispatch(const ServiceProvider& services, const HideDockRequest& request);
Response dispatch(const ServiceProvider& services, const ShowDockRequest& request);
Response dispatch(const ServiceProvider& services, const IsDockHiddenRequest& request);
Response dispatch(const ServiceProvider& services, const FindDockItemRequest& request);

// Dialogs
Response dispatch(const ServiceProvider& services, const DialogFindActiveRequest& request);
Response dispatch(const ServiceProvider& services, const DialogClickButtonRequest& request);
Response dispatch(const ServiceProvider& services, const DialogEnterTextRequest& request);
Response dispatch(const ServiceProvider& services, const DialogHandleFileRequest& request);
Response dispatch(const ServiceProvider& services, const DialogDismissRequest& request);
Response dispatch(const ServiceProvider& services, const DialogListElementsRequest& request);

// Sessions
Response dispatch(const ServiceProvider& services, const CreateSessionRequest& request);
Response dispatch(const ServiceProvider& services, const StoreDetectionResultRequest& request);
Response dispatch(const ServiceProvider& services, const GetDetectionResultRequest& request);
Response dispatch(const ServiceProvider& services, const StoreScreenshotRequest& request);
Response dispatch(const ServiceProvider& services, const StoreAnnotatedScreenshotRequest& request);
Response dispatch(const ServiceProvider& services, const ListSessionsRequest& request);
Response dispatch(const ServiceProvider& services, const GetMostRecentSessionRequest& request);
Response dispatch(const ServiceProvider& services, const CleanSessionRequest& request);
Response dispatch(const ServiceProvider& services, const CleanSessionsOlderThanRequest& request);
Response dispatch(const ServiceProvider& services, const CleanAllSessionsRequest& request);

} // namespace autobridge::actions
