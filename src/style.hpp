#pragma once
#include <imgui.h>

// Call this once after ImGui::CreateContext() and before your first frame.
// Dark slate theme, green accent shared with the follow-now indicator.
inline void SetupTimelineStyle(float dpiScale = 1.0f)
{
    ImGui::StyleColorsDark();
    ImGuiStyle& s = ImGui::GetStyle();
    s.WindowRounding = 6.0f;
    s.FrameRounding  = 4.0f;
    s.ChildRounding  = 6.0f;
    s.GrabRounding   = 4.0f;
    s.PopupRounding  = 6.0f;
    s.TabRounding    = 6.0f;
    s.ScrollbarRounding = 6.0f;

    s.FramePadding  = ImVec2(8, 5);
    s.ItemSpacing   = ImVec2(8, 6);
    s.WindowPadding = ImVec2(10, 10);
    s.WindowBorderSize = 1.0f;
    s.FrameBorderSize  = 0.0f;

    ImVec4* c = s.Colors;
    const ImVec4 accent      (0.42f, 0.80f, 0.58f, 1.00f);
    const ImVec4 accentHover (0.52f, 0.88f, 0.66f, 1.00f);
    const ImVec4 surface     (0.16f, 0.21f, 0.25f, 1.00f);
    const ImVec4 surfaceHover(0.21f, 0.28f, 0.33f, 1.00f);
    const ImVec4 surfaceOn   (0.25f, 0.33f, 0.39f, 1.00f);

    c[ImGuiCol_Text]           = ImVec4(0.88f, 0.92f, 0.96f, 1.00f);
    c[ImGuiCol_TextDisabled]   = ImVec4(0.52f, 0.58f, 0.64f, 1.00f);
    c[ImGuiCol_WindowBg]       = ImVec4(0.07f, 0.09f, 0.11f, 1.00f);
    c[ImGuiCol_PopupBg]        = ImVec4(0.09f, 0.12f, 0.15f, 0.97f);
    c[ImGuiCol_Border]         = ImVec4(0.17f, 0.21f, 0.25f, 0.70f);
    c[ImGuiCol_FrameBg]        = ImVec4(0.11f, 0.15f, 0.18f, 1.00f);
    c[ImGuiCol_FrameBgHovered] = surface;
    c[ImGuiCol_FrameBgActive]  = surfaceHover;
    c[ImGuiCol_TitleBg]        = ImVec4(0.06f, 0.08f, 0.10f, 1.00f);
    c[ImGuiCol_TitleBgActive]  = ImVec4(0.09f, 0.12f, 0.15f, 1.00f);
    c[ImGuiCol_Button]         = surface;
    c[ImGuiCol_ButtonHovered]  = surfaceHover;
    c[ImGuiCol_ButtonActive]   = surfaceOn;
    c[ImGuiCol_Header]         = surface;
    c[ImGuiCol_HeaderHovered]  = surfaceHover;
    c[ImGuiCol_HeaderActive]   = surfaceOn;
    c[ImGuiCol_CheckMark]      = accent;
    c[ImGuiCol_SliderGrab]     = accent;
    c[ImGuiCol_SliderGrabActive] = accentHover;
    c[ImGuiCol_Separator]      = ImVec4(0.21f, 0.27f, 0.32f, 0.60f);

    if (dpiScale > 0.0f && dpiScale != 1.0f)
    {
        s.ScaleAllSizes(dpiScale);
        ImGui::GetIO().FontGlobalScale = dpiScale;
    }
}
